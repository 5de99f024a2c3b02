#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <spdlog/spdlog.h>

namespace evalbox {

// Ordered list of best-effort candidate actions. Candidates run left to right
// until one reports success; an exception counts as a failed candidate.
class FallbackChain {
public:
    using Attempt = std::function<bool()>;

    FallbackChain(std::string label, std::shared_ptr<spdlog::logger> logger)
        : label_(std::move(label)), logger_(std::move(logger)) {}

    FallbackChain& then(std::string description, Attempt attempt) {
        candidates_.push_back({std::move(description), std::move(attempt)});
        return *this;
    }

    // Index of the candidate that succeeded, or nullopt when all of them failed.
    std::optional<size_t> run() const {
        for (size_t i = 0; i < candidates_.size(); ++i) {
            const auto& candidate = candidates_[i];
            try {
                if (candidate.attempt()) {
                    logger_->debug("{}: '{}' succeeded", label_, candidate.description);
                    return i;
                }
                logger_->debug("{}: '{}' failed", label_, candidate.description);
            } catch (const std::exception& e) {
                logger_->warn("{}: '{}' raised: {}", label_, candidate.description, e.what());
            }
        }
        logger_->warn("⚠️ {}: all {} candidates failed", label_, candidates_.size());
        return std::nullopt;
    }

    size_t size() const { return candidates_.size(); }

private:
    struct Candidate {
        std::string description;
        Attempt attempt;
    };

    std::string label_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<Candidate> candidates_;
};

}
