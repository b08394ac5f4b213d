#pragma once

#include "core/types.h"
#include <string>
#include <vector>
#include <mutex>

namespace parley {

/**
 * @brief Heuristic token counter with running calibration
 *
 * Raw estimates weight each code point by its width class (ASCII, other
 * narrow scripts, CJK/fullwidth). The estimate is not authoritative: every
 * time the provider reports real usage for a request whose size was
 * estimated, calibrate() folds the observed ratio into a scale factor.
 */
class TokenEstimator {
public:
    TokenEstimator();

    /// Calibrated estimate for raw text
    int estimate(const std::string& text) const;

    /// Calibrated estimate for one message, including framing overhead
    int estimate(const Message& message) const;

    int estimate(const std::vector<Message>& messages) const;

    /// Uncalibrated character-class estimate
    static double raw_estimate(const std::string& text);

    /**
     * @brief Fold real usage into the running scale
     * @param estimated_tokens What estimate() returned for the prompt
     * @param actual_tokens Provider-reported prompt tokens
     */
    void calibrate(int estimated_tokens, int actual_tokens);

    double scale() const;
    int calibration_samples() const;

private:
    mutable std::mutex mutex_;
    double scale_;
    int samples_;
};

} // namespace parley
