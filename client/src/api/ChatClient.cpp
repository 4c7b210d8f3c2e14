#include "api/ChatClient.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "api/CallSupport.hpp"
#include "core/Errors.hpp"
#include "net/HttpTransport.hpp"
#include "utils/Log.hpp"

using json = nlohmann::json;

ChatClient::ChatClient(HttpTransport& transport, std::string chatServiceUrl, Logger* callLog)
    : transport_(transport), chatServiceUrl_(std::move(chatServiceUrl)), callLog_(callLog) {}

std::string ChatClient::ask(const ChatQuestion& question,
                            const std::optional<std::string>& credential,
                            const CancellationToken* cancel) const {
    bool blank = std::all_of(question.userInput.begin(), question.userInput.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        throw std::invalid_argument("Chat message must not be empty");
    }

    const std::string url = chatServiceUrl_ + "/chat";
    CallTimer timer;
    LogEntry entry = beginEntry("chat", "", url);

    HttpRequest req = jsonRequest(HttpMethod::Post, url, credential);
    req.body = serializeBody(json{
        {"user_input", question.userInput},
        {"team_a", question.teamA},
        {"team_b", question.teamB},
        {"match_date", question.matchDate}
    });

    LOGX("CHAT", "Asking about " << question.teamA << " vs " << question.teamB
                 << " on " << question.matchDate);

    std::string answer;
    try {
        HttpResponse res = transport_.send(req, cancel);
        entry.http_status = res.statusCode;
        ensureSuccess(res, "Chat");

        json j = json::parse(res.body, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object() || !j.contains("response") || !j["response"].is_string()) {
            throw TransportError(res.statusCode, "missing \"response\" text",
                                 "Chat: malformed reply, missing \"response\" text");
        }
        answer = j["response"].get<std::string>();
    } catch (const ClientError& e) {
        LOGE("CHAT", e.what());
        recordFailure(callLog_, entry, timer);
        throw;
    }
    recordCall(callLog_, entry, timer);
    return answer;
}
