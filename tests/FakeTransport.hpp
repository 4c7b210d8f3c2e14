#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "net/CancellationToken.hpp"
#include "net/HttpTransport.hpp"

// In-memory HttpTransport: scripted replies per URL, records every request.
class FakeTransport : public HttpTransport {
public:
    void respond(const std::string& url, long status, std::string body) {
        std::lock_guard<std::mutex> lock(mtx_);
        routes_[url] = Route{status, std::move(body), false};
    }

    void failNetwork(const std::string& url) {
        std::lock_guard<std::mutex> lock(mtx_);
        routes_[url] = Route{0, "", true};
    }

    // Runs inside send(), before the reply is produced, without holding the lock.
    void onSend(std::function<void(const HttpRequest&)> hook) {
        std::lock_guard<std::mutex> lock(mtx_);
        hook_ = std::move(hook);
    }

    HttpResponse send(const HttpRequest& req, const CancellationToken* cancel) override {
        std::function<void(const HttpRequest&)> hook;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            requests_.push_back(req);
            hook = hook_;
        }
        if (hook) hook(req);

        if (cancel && cancel->isCancelled()) throw OperationCancelled();

        std::lock_guard<std::mutex> lock(mtx_);
        auto it = routes_.find(req.url);
        if (it == routes_.end()) {
            return HttpResponse{404, R"({"detail":"Not Found"})"};
        }
        if (it->second.networkFailure) {
            throw TransportError(0, "Couldn't connect to server", req.url + ": Couldn't connect to server");
        }
        return HttpResponse{it->second.status, it->second.body};
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

    std::size_t callCount() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_.size();
    }

    HttpRequest lastRequest() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_.back();
    }

private:
    struct Route {
        long status;
        std::string body;
        bool networkFailure;
    };

    mutable std::mutex mtx_;
    std::map<std::string, Route> routes_;
    std::vector<HttpRequest> requests_;
    std::function<void(const HttpRequest&)> hook_;
};
