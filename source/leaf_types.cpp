// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/leaf_types.h>

#include <sstream>
#include <type_traits>

namespace post_body {

std::string_view embed_provider_name(EmbedProvider provider) noexcept
{
    switch (provider) {
        case EmbedProvider::YouTube:    return "youtube";
        case EmbedProvider::SoundCloud: return "soundcloud";
        case EmbedProvider::Vimeo:      return "vimeo";
        case EmbedProvider::Coub:       return "coub";
        case EmbedProvider::Twitter:    return "twitter";
        case EmbedProvider::Imgur:      return "imgur";
        case EmbedProvider::BitChute:   return "bitchute";
        case EmbedProvider::Invidious:  return "invidious";
    }
    return "unknown";
}

std::string to_string(const PostLink& link)
{
    std::ostringstream oss;
    oss << ">>" << link.id << " (thread " << link.thread << ", page " << link.page << ")";
    return oss.str();
}

std::string to_string(const Reference& ref)
{
    return "[" + ref.label + "](" + ref.url + ")";
}

std::string to_string(const Embed& embed)
{
    std::string result{embed_provider_name(embed.provider)};
    result += ":";
    result += embed.data;
    return result;
}

std::string to_string(const Command& cmd)
{
    return std::visit([](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        std::ostringstream oss;

        if constexpr (std::is_same_v<T, command::Dice>) {
            oss << "#dice(" << c.faces << ", " << c.offset << ") [";
            for (std::size_t i = 0; i < c.results.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << c.results[i];
            }
            oss << "]";
        } else if constexpr (std::is_same_v<T, command::Flip>) {
            oss << "#flip " << (c.value ? "true" : "false");
        } else if constexpr (std::is_same_v<T, command::EightBall>) {
            oss << "#8ball \"" << c.answer << "\"";
        } else if constexpr (std::is_same_v<T, command::Countdown>) {
            oss << "#countdown(" << c.start << ", " << c.secs << ")";
        } else if constexpr (std::is_same_v<T, command::Autobahn>) {
            oss << "#autobahn " << c.hours;
        } else if constexpr (std::is_same_v<T, command::Pyu>) {
            oss << "#pyu " << c.count;
        } else if constexpr (std::is_same_v<T, command::PCount>) {
            oss << "#pcount " << c.count;
        }
        return oss.str();
    }, cmd);
}

std::string to_string(const PendingNode& node)
{
    return std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        std::ostringstream oss;
        oss << "pending ";

        if constexpr (std::is_same_v<T, pending::Flip>) {
            oss << "#flip";
        } else if constexpr (std::is_same_v<T, pending::EightBall>) {
            oss << "#8ball";
        } else if constexpr (std::is_same_v<T, pending::Pyu>) {
            oss << "#pyu";
        } else if constexpr (std::is_same_v<T, pending::PCount>) {
            oss << "#pcount";
        } else if constexpr (std::is_same_v<T, pending::Countdown>) {
            oss << "#countdown(" << p.secs << ")";
        } else if constexpr (std::is_same_v<T, pending::Autobahn>) {
            oss << "#autobahn(" << p.hours << ")";
        } else if constexpr (std::is_same_v<T, pending::Dice>) {
            oss << "#" << static_cast<unsigned>(p.rolls) << "d" << p.faces;
            if (p.offset != 0) oss << (p.offset > 0 ? "+" : "") << p.offset;
        } else if constexpr (std::is_same_v<T, pending::PostLink>) {
            oss << ">>" << p.id;
        }
        return oss.str();
    }, node);
}

} // namespace post_body
