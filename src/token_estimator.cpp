#include "token_estimator.h"
#include "core/constants.h"
#include "logger.h"
#include <algorithm>
#include <cmath>

namespace parley {

namespace {

bool is_wide_code_point(uint32_t cp) {
    return (cp >= 0x1100 && cp <= 0x115F) ||    // Hangul Jamo
           (cp >= 0x2E80 && cp <= 0x303E) ||    // CJK radicals, punctuation
           (cp >= 0x3040 && cp <= 0x33FF) ||    // Kana, CJK compatibility
           (cp >= 0x3400 && cp <= 0x4DBF) ||    // CJK extension A
           (cp >= 0x4E00 && cp <= 0x9FFF) ||    // CJK unified ideographs
           (cp >= 0xAC00 && cp <= 0xD7A3) ||    // Hangul syllables
           (cp >= 0xF900 && cp <= 0xFAFF) ||    // CJK compatibility ideographs
           (cp >= 0xFF00 && cp <= 0xFF60) ||    // Fullwidth forms
           (cp >= 0x20000 && cp <= 0x2FFFD);
}

} // namespace

TokenEstimator::TokenEstimator() : scale_(1.0), samples_(0) {}

double TokenEstimator::raw_estimate(const std::string& text) {
    double total = 0.0;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            total += constants::tokens::ASCII_WEIGHT;
            ++i;
            continue;
        }

        size_t len = 1;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else { total += constants::tokens::NARROW_WEIGHT; ++i; continue; }  // stray continuation byte

        for (size_t k = 1; k < len && i + k < text.size(); ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }
        total += is_wide_code_point(cp) ? constants::tokens::WIDE_WEIGHT
                                        : constants::tokens::NARROW_WEIGHT;
        i += len;
    }
    return total;
}

int TokenEstimator::estimate(const std::string& text) const {
    double s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s = scale_;
    }
    return static_cast<int>(std::ceil(raw_estimate(text) * s));
}

int TokenEstimator::estimate(const Message& message) const {
    std::string payload = message.content;
    for (const auto& call : message.tool_calls) {
        payload += call.name;
        payload += call.arguments;
    }
    payload += message.tool_call_id;
    return estimate(payload) + constants::tokens::PER_MESSAGE_OVERHEAD;
}

int TokenEstimator::estimate(const std::vector<Message>& messages) const {
    int total = 0;
    for (const auto& msg : messages) {
        total += estimate(msg);
    }
    return total;
}

void TokenEstimator::calibrate(int estimated_tokens, int actual_tokens) {
    if (estimated_tokens <= 0 || actual_tokens <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // estimated_tokens already includes the current scale; recover the raw ratio
    double observed = scale_ * static_cast<double>(actual_tokens) / estimated_tokens;
    double alpha = constants::tokens::CALIBRATION_ALPHA;
    double next = samples_ == 0 ? observed : (1.0 - alpha) * scale_ + alpha * observed;
    scale_ = std::clamp(next, constants::tokens::MIN_SCALE, constants::tokens::MAX_SCALE);
    ++samples_;
    Logger::debug("[Tokens] calibration scale=" + std::to_string(scale_) +
                  " (estimated=" + std::to_string(estimated_tokens) +
                  ", actual=" + std::to_string(actual_tokens) + ")");
}

double TokenEstimator::scale() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scale_;
}

int TokenEstimator::calibration_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

} // namespace parley
