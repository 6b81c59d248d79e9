#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

class WakewordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Scores fixed-size mono frames against a set of named wakeword profiles.
class WakewordModel {
public:
    virtual ~WakewordModel() = default;

    // Frame length and rate the model scores at.
    virtual std::size_t samples_per_frame() const = 0;
    virtual unsigned sample_rate() const = 0;

    // Throws WakewordError if the file is unreadable or not a valid profile.
    virtual void add_profile(const std::string& name, const std::string& path) = 0;
    virtual std::size_t profile_count() const = 0;

    // `frame` holds samples_per_frame() samples in [-1, 1]. Returns the name
    // of the detected profile, if any.
    virtual std::optional<std::string> process(const float* frame) = 0;
};
