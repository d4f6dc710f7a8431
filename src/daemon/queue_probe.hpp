#pragma once

#include <cstdint>
#include <optional>
#include <string>

/// Message-queue depth per logical name. nullopt means "unavailable",
/// which rules out a queue breach but is never an error.
class QueueProbe {
public:
    virtual ~QueueProbe() = default;
    virtual std::optional<uint64_t> queue_depth(const std::string& logical_name) = 0;
};

/// Platforms without a message-queue facility
class UnavailableQueueProbe : public QueueProbe {
public:
    std::optional<uint64_t> queue_depth(const std::string&) override { return std::nullopt; }
};
