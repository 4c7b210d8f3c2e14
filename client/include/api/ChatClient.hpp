#pragma once
#include <optional>
#include <string>

class HttpTransport;
class CancellationToken;
class Logger;

struct ChatQuestion {
    std::string userInput;
    std::string teamA;
    std::string teamB;
    std::string matchDate;   // YYYY-MM-DD
};

// Asks the match chat assistant a free-text question about one fixture.
class ChatClient {
public:
    ChatClient(HttpTransport& transport, std::string chatServiceUrl, Logger* callLog = nullptr);

    // POST /chat {user_input, team_a, team_b, match_date}; returns the
    // assistant's "response" text. Blank input is std::invalid_argument.
    std::string ask(const ChatQuestion& question,
                    const std::optional<std::string>& credential = std::nullopt,
                    const CancellationToken* cancel = nullptr) const;

private:
    HttpTransport& transport_;
    std::string chatServiceUrl_;
    Logger* callLog_;
};
