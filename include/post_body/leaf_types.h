// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file leaf_types.h
/// @brief Opaque leaf payloads of a post body tree.
///
/// These are already-resolved values (post links with their parent thread,
/// executed hash commands, identified embeds). Diffing never descends into
/// them: two leaves are either equal or the whole leaf is replaced.

#pragma once

#include <post_body/api.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace post_body {

/// Link to another post
struct PostLink {
    uint64_t id = 0;

    /// Target post's parent thread. 0 means parenthood not looked up yet.
    uint64_t thread = 0;

    /// Parent page of the target post
    uint32_t page = 0;

    bool operator==(const PostLink&) const = default;
};

/// Configured reference to a URL
struct Reference {
    std::string label;
    std::string url;

    bool operator==(const Reference&) const = default;
};

/// Embedded content providers
enum class EmbedProvider : uint8_t {
    YouTube,
    SoundCloud,
    Vimeo,
    Coub,
    Twitter,
    Imgur,
    BitChute,
    Invidious,
};

/// Describes and identifies a specific embeddable resource
struct Embed {
    EmbedProvider provider = EmbedProvider::YouTube;
    std::string data;

    bool operator==(const Embed&) const = default;
};

// ============================================================
// Hash command results
// ============================================================

namespace command {

/// Parameters and results of one dice throw
struct Dice {
    /// Amount to offset the sum of all throws by
    int16_t offset = 0;

    /// Faces of the die
    uint16_t faces = 0;

    /// One result per throw
    std::vector<uint16_t> results;

    bool operator==(const Dice&) const = default;
};

struct Flip {
    bool value = false;
    bool operator==(const Flip&) const = default;
};

/// #8ball answer
struct EightBall {
    std::string answer;
    bool operator==(const EightBall&) const = default;
};

/// Synchronized countdown timer
struct Countdown {
    uint32_t start = 0;

    /// Unix timestamp
    uint32_t secs = 0;

    bool operator==(const Countdown&) const = default;
};

/// Self ban for N hours
struct Autobahn {
    uint16_t hours = 0;
    bool operator==(const Autobahn&) const = default;
};

struct Pyu {
    uint64_t count = 0;
    bool operator==(const Pyu&) const = default;
};

struct PCount {
    uint64_t count = 0;
    bool operator==(const PCount&) const = default;
};

} // namespace command

using Command = std::variant<command::Dice,
                             command::Flip,
                             command::EightBall,
                             command::Countdown,
                             command::Autobahn,
                             command::Pyu,
                             command::PCount>;

// ============================================================
// Pending nodes
//
// Nodes awaiting database access or processing on the server.
// They must never reach an observer.
// ============================================================

namespace pending {

struct Flip {
    bool operator==(const Flip&) const = default;
};

struct EightBall {
    bool operator==(const EightBall&) const = default;
};

struct Pyu {
    bool operator==(const Pyu&) const = default;
};

struct PCount {
    bool operator==(const PCount&) const = default;
};

/// Seconds to count down
struct Countdown {
    uint64_t secs = 0;
    bool operator==(const Countdown&) const = default;
};

/// Hours to ban self for
struct Autobahn {
    uint16_t hours = 0;
    bool operator==(const Autobahn&) const = default;
};

struct Dice {
    int16_t offset = 0;
    uint16_t faces = 0;
    uint8_t rolls = 0;
    bool operator==(const Dice&) const = default;
};

/// Pending post location fetch
struct PostLink {
    uint64_t id = 0;
    bool operator==(const PostLink&) const = default;
};

} // namespace pending

using PendingNode = std::variant<pending::Flip,
                                 pending::EightBall,
                                 pending::Pyu,
                                 pending::PCount,
                                 pending::Countdown,
                                 pending::Autobahn,
                                 pending::Dice,
                                 pending::PostLink>;

// ============================================================
// Debug formatting
// ============================================================

[[nodiscard]] POST_BODY_API std::string_view embed_provider_name(EmbedProvider provider) noexcept;
[[nodiscard]] POST_BODY_API std::string to_string(const PostLink& link);
[[nodiscard]] POST_BODY_API std::string to_string(const Reference& ref);
[[nodiscard]] POST_BODY_API std::string to_string(const Embed& embed);
[[nodiscard]] POST_BODY_API std::string to_string(const Command& cmd);
[[nodiscard]] POST_BODY_API std::string to_string(const PendingNode& node);

} // namespace post_body
