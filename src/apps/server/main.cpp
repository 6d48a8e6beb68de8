// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief rein console server entry-point.
///
/// Stands in for a network transport: every stdin line is one event.
///   +<id> [name]        connect a session
///   -<id>               disconnect a session
///   <id> /link <id>...  lead the characters of other sessions
///   <id> /unlink        dissolve the group led by <id>
///   <id> /reclaim       take back your own character
///   <id> <text>         send a command line
/// Pending messages are printed as "<id>: <message>" after each event.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/engine/Config.hpp>
#include <rein/engine/Server.hpp>
#include <rein/core/Log.hpp>
#include <rein/core/Types.hpp>

#include <charconv>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::optional<rein::core::SessionId> parseId(std::string_view text)
{
    rein::core::SessionId id{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || end != text.data() + text.size())
        return std::nullopt;
    return id;
}

rein::core::Expected<void> dispatch(rein::engine::Server& server, const std::string& line)
{
    using rein::core::ErrorCode;
    using rein::core::makeError;

    std::istringstream in{line};
    std::string head;
    in >> head;

    if (head.size() > 1 && (head.front() == '+' || head.front() == '-'))
    {
        const auto id = parseId(std::string_view{head}.substr(1));
        if (!id)
            return makeError(ErrorCode::InvalidArgument, "bad session id: " + head);

        if (head.front() == '-')
            return server.disconnect(*id);

        std::string name;
        std::getline(in >> std::ws, name);
        return server.connect(*id, std::move(name));
    }

    const auto id = parseId(head);
    if (!id)
        return makeError(ErrorCode::InvalidArgument, "bad session id: " + head);

    std::string rest;
    std::getline(in >> std::ws, rest);

    if (rest == "/link" || rest.starts_with("/link "))
    {
        std::istringstream args{rest.substr(5)};
        std::vector<rein::core::SessionId> followers;
        std::string token;
        while (args >> token)
        {
            const auto follower = parseId(token);
            if (!follower)
                return makeError(ErrorCode::InvalidArgument, "bad session id: " + token);
            followers.push_back(*follower);
        }
        return server.link(*id, followers);
    }
    if (rest == "/unlink")
        return server.unlink(*id);
    if (rest == "/reclaim")
        return server.reclaim(*id);

    return server.command(*id, std::move(rest));
}

} // namespace

int main(int argc, char* argv[])
{
    const bool verbose = argc > 1 && std::string_view{argv[1]} == "--debug";

    auto config = rein::engine::Config::Builder{}
        .logLevel(verbose ? rein::core::LogLevel::kDebug : rein::core::LogLevel::kInfo)
        .maxSessions(rein::core::kMaxSessions)
        .dedupWindowFactor(rein::core::kDedupWindowFactor)
        .build();

    rein::engine::Server server{config};
    rein::core::Log::info("SERVER", "=== rein console server ===");

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;

        if (auto result = dispatch(server, line); !result)
        {
            const auto& error = result.error();
            rein::core::Log::warn("SERVER", std::string{rein::core::toString(error.code())} + ": " + error.message());
        }

        server.drain([](rein::core::SessionId id, const rein::core::Message& message) {
            std::cout << id << ": " << message << '\n';
        });
        std::cout.flush();
    }

    rein::core::Log::info("SERVER", "Server exited cleanly");
    return 0;
}
