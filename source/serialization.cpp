// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <post_body/serialization.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace post_body {

namespace {

// Helper: write bytes to buffer
// Integers are copied in native byte order, which is little-endian on every
// supported target
class ByteWriter {
public:
    ByteBuffer buffer;

    void write_u8(uint8_t v) {
        buffer.push_back(v);
    }

    template <typename T>
    void write_int(T v) {
        static_assert(std::is_integral_v<T>);
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + sizeof(v));
        std::memcpy(buffer.data() + old_size, &v, sizeof(v));
    }

    void write_u16(uint16_t v) { write_int(v); }
    void write_i16(int16_t v) { write_int(v); }
    void write_u32(uint32_t v) { write_int(v); }
    void write_u64(uint64_t v) { write_int(v); }

    void write_count(std::size_t n) {
        if (n > UINT32_MAX) {
            throw std::runtime_error("Sequence too long to encode: " + std::to_string(n));
        }
        write_u32(static_cast<uint32_t>(n));
    }

    void write_string(const std::string& s) {
        write_count(s.size());
        std::size_t old_size = buffer.size();
        buffer.resize(old_size + s.size());
        std::memcpy(buffer.data() + old_size, s.data(), s.size());
    }
};

// Helper: read bytes from buffer
class ByteReader {
public:
    const uint8_t* data;
    std::size_t size;
    std::size_t pos = 0;
    std::size_t depth = 0;

    ByteReader(const uint8_t* d, std::size_t s) : data(d), size(s) {}

    bool has_bytes(std::size_t n) const {
        return n <= size - pos;
    }

    uint8_t read_u8() {
        if (!has_bytes(1)) throw std::runtime_error("Unexpected end of buffer");
        return data[pos++];
    }

    template <typename T>
    T read_int() {
        if (!has_bytes(sizeof(T))) throw std::runtime_error("Unexpected end of buffer");
        T v;
        std::memcpy(&v, data + pos, sizeof(v));
        pos += sizeof(v);
        return v;
    }

    uint16_t read_u16() { return read_int<uint16_t>(); }
    int16_t read_i16() { return read_int<int16_t>(); }
    uint32_t read_u32() { return read_int<uint32_t>(); }
    uint64_t read_u64() { return read_int<uint64_t>(); }

    bool read_bool() {
        uint8_t v = read_u8();
        if (v > 1) throw std::runtime_error("Invalid bool byte: " + std::to_string(static_cast<int>(v)));
        return v != 0;
    }

    std::string read_string() {
        uint32_t len = read_u32();
        if (!has_bytes(len)) throw std::runtime_error("Unexpected end of buffer");
        std::string s(reinterpret_cast<const char*>(data + pos), len);
        pos += len;
        return s;
    }

    /// Reserve hint for a sequence of count elements of at least min_size bytes each
    std::size_t reserve_hint(uint32_t count, std::size_t min_size) const {
        return std::min<std::size_t>(count, (size - pos) / min_size);
    }

    void enter() {
        if (++depth > max_decode_depth) {
            throw std::runtime_error("Nesting exceeds " + std::to_string(max_decode_depth) + " levels");
        }
    }

    void leave() { --depth; }

    void expect_end() const {
        if (pos != size) {
            throw std::runtime_error("Trailing bytes after payload: " + std::to_string(size - pos));
        }
    }
};

// ============================================================
// Encoding
// ============================================================

void write_command(ByteWriter& w, const Command& cmd)
{
    w.write_u8(static_cast<uint8_t>(cmd.index()));
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, command::Dice>) {
            w.write_i16(arg.offset);
            w.write_u16(arg.faces);
            w.write_count(arg.results.size());
            for (uint16_t r : arg.results) {
                w.write_u16(r);
            }
        } else if constexpr (std::is_same_v<T, command::Flip>) {
            w.write_u8(arg.value ? 1 : 0);
        } else if constexpr (std::is_same_v<T, command::EightBall>) {
            w.write_string(arg.answer);
        } else if constexpr (std::is_same_v<T, command::Countdown>) {
            w.write_u32(arg.start);
            w.write_u32(arg.secs);
        } else if constexpr (std::is_same_v<T, command::Autobahn>) {
            w.write_u16(arg.hours);
        } else if constexpr (std::is_same_v<T, command::Pyu> || std::is_same_v<T, command::PCount>) {
            w.write_u64(arg.count);
        }
    }, cmd);
}

void write_pending(ByteWriter& w, const PendingNode& node)
{
    w.write_u8(static_cast<uint8_t>(node.index()));
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, pending::Countdown>) {
            w.write_u64(arg.secs);
        } else if constexpr (std::is_same_v<T, pending::Autobahn>) {
            w.write_u16(arg.hours);
        } else if constexpr (std::is_same_v<T, pending::Dice>) {
            w.write_i16(arg.offset);
            w.write_u16(arg.faces);
            w.write_u8(arg.rolls);
        } else if constexpr (std::is_same_v<T, pending::PostLink>) {
            w.write_u64(arg.id);
        }
        // Flip, EightBall, Pyu and PCount carry no fields
    }, node);
}

void write_node(ByteWriter& w, const Node& node)
{
    w.write_u8(static_cast<uint8_t>(node.kind()));
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, nodes::Empty> || std::is_same_v<T, nodes::NewLine>) {
            // no extra data
        } else if constexpr (std::is_same_v<T, NodeList>) {
            w.write_count(arg.size());
            for (const auto& child : arg) {
                write_node(w, child);
            }
        } else if constexpr (std::is_same_v<T, nodes::Text> ||
                             std::is_same_v<T, nodes::URL> ||
                             std::is_same_v<T, nodes::Code>) {
            w.write_string(arg.value);
        } else if constexpr (std::is_same_v<T, PostLink>) {
            w.write_u64(arg.id);
            w.write_u64(arg.thread);
            w.write_u32(arg.page);
        } else if constexpr (std::is_same_v<T, Command>) {
            write_command(w, arg);
        } else if constexpr (std::is_same_v<T, Reference>) {
            w.write_string(arg.label);
            w.write_string(arg.url);
        } else if constexpr (std::is_same_v<T, Embed>) {
            w.write_u8(static_cast<uint8_t>(arg.provider));
            w.write_string(arg.data);
        } else if constexpr (std::is_same_v<T, PendingNode>) {
            write_pending(w, arg);
        } else {
            // Wrappers
            if (arg.inner) {
                write_node(w, *arg.inner);
            } else {
                write_node(w, Node{});
            }
        }
    }, node.data);
}

void write_patch(ByteWriter& w, const Patch& patch)
{
    w.write_u8(static_cast<uint8_t>(patch.kind()));
    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, patches::Replace>) {
            write_node(w, arg.node);
        } else if constexpr (std::is_same_v<T, TextPatch>) {
            w.write_u16(arg.position);
            w.write_u16(arg.remove);
            w.write_count(arg.insert.size());
            for (char32_t c : arg.insert) {
                w.write_u32(static_cast<uint32_t>(c));
            }
        } else if constexpr (std::is_same_v<T, patches::Wrapped>) {
            if (!arg.inner) {
                throw std::runtime_error("Cannot encode Wrapped patch without inner patch");
            }
            write_patch(w, *arg.inner);
        } else if constexpr (std::is_same_v<T, patches::Children>) {
            w.write_count(arg.patch.size());
            for (const auto& [index, sub] : arg.patch) {
                w.write_u64(static_cast<uint64_t>(index));
                write_patch(w, sub);
            }
            w.write_u8(arg.truncate ? 1 : 0);
            if (arg.truncate) {
                w.write_u64(static_cast<uint64_t>(*arg.truncate));
            }
            w.write_count(arg.append.size());
            for (const auto& node : arg.append) {
                write_node(w, node);
            }
        }
    }, patch.data);
}

// ============================================================
// Decoding
// ============================================================

Node read_node(ByteReader& r);

Command read_command(ByteReader& r)
{
    uint8_t tag = r.read_u8();
    switch (tag) {
        case 0: {
            command::Dice dice;
            dice.offset = r.read_i16();
            dice.faces = r.read_u16();
            uint32_t count = r.read_u32();
            dice.results.reserve(r.reserve_hint(count, sizeof(uint16_t)));
            for (uint32_t i = 0; i < count; ++i) {
                dice.results.push_back(r.read_u16());
            }
            return dice;
        }
        case 1: return command::Flip{r.read_bool()};
        case 2: return command::EightBall{r.read_string()};
        case 3: {
            command::Countdown countdown;
            countdown.start = r.read_u32();
            countdown.secs = r.read_u32();
            return countdown;
        }
        case 4: return command::Autobahn{r.read_u16()};
        case 5: return command::Pyu{r.read_u64()};
        case 6: return command::PCount{r.read_u64()};
        default:
            throw std::runtime_error("Unknown command tag: " + std::to_string(static_cast<int>(tag)));
    }
}

PendingNode read_pending(ByteReader& r)
{
    uint8_t tag = r.read_u8();
    switch (tag) {
        case 0: return pending::Flip{};
        case 1: return pending::EightBall{};
        case 2: return pending::Pyu{};
        case 3: return pending::PCount{};
        case 4: return pending::Countdown{r.read_u64()};
        case 5: return pending::Autobahn{r.read_u16()};
        case 6: {
            pending::Dice dice;
            dice.offset = r.read_i16();
            dice.faces = r.read_u16();
            dice.rolls = r.read_u8();
            return dice;
        }
        case 7: return pending::PostLink{r.read_u64()};
        default:
            throw std::runtime_error("Unknown pending node tag: " + std::to_string(static_cast<int>(tag)));
    }
}

Node read_node_payload(ByteReader& r, uint8_t tag)
{
    switch (static_cast<NodeKind>(tag)) {
        case NodeKind::Empty:
            return Node{};

        case NodeKind::NewLine:
            return Node::newline();

        case NodeKind::Children: {
            uint32_t count = r.read_u32();
            NodeList list;
            list.reserve(r.reserve_hint(count, 1));
            for (uint32_t i = 0; i < count; ++i) {
                list.push_back(read_node(r));
            }
            return Node{std::move(list)};
        }

        case NodeKind::Text:
            return Node::text(r.read_string());

        case NodeKind::PostLink: {
            PostLink link;
            link.id = r.read_u64();
            link.thread = r.read_u64();
            link.page = r.read_u32();
            return Node{link};
        }

        case NodeKind::Command:
            return Node{read_command(r)};

        case NodeKind::URL:
            return Node::url(r.read_string());

        case NodeKind::Reference: {
            Reference ref;
            ref.label = r.read_string();
            ref.url = r.read_string();
            return Node{std::move(ref)};
        }

        case NodeKind::Embed: {
            uint8_t provider = r.read_u8();
            if (provider > static_cast<uint8_t>(EmbedProvider::Invidious)) {
                throw std::runtime_error("Unknown embed provider: " + std::to_string(static_cast<int>(provider)));
            }
            Embed embed;
            embed.provider = static_cast<EmbedProvider>(provider);
            embed.data = r.read_string();
            return Node{std::move(embed)};
        }

        case NodeKind::Code:
            return Node::code(r.read_string());

        case NodeKind::Spoiler:
            return Node::spoiler(read_node(r));

        case NodeKind::Bold:
            return Node::bold(read_node(r));

        case NodeKind::Italic:
            return Node::italic(read_node(r));

        case NodeKind::Quoted:
            return Node::quote(read_node(r));

        case NodeKind::Pending:
            return Node{read_pending(r)};
    }
    throw std::runtime_error("Unknown node tag: " + std::to_string(static_cast<int>(tag)));
}

Node read_node(ByteReader& r)
{
    uint8_t tag = r.read_u8();
    r.enter();
    Node node = read_node_payload(r, tag);
    r.leave();
    return node;
}

Patch read_patch(ByteReader& r);

Patch read_patch_payload(ByteReader& r, uint8_t tag)
{
    switch (static_cast<PatchKind>(tag)) {
        case PatchKind::Replace:
            return Patch::replace(read_node(r));

        case PatchKind::Text: {
            TextPatch text;
            text.position = r.read_u16();
            text.remove = r.read_u16();
            uint32_t count = r.read_u32();
            text.insert.reserve(r.reserve_hint(count, sizeof(uint32_t)));
            for (uint32_t i = 0; i < count; ++i) {
                text.insert.push_back(static_cast<char32_t>(r.read_u32()));
            }
            return Patch::text(std::move(text));
        }

        case PatchKind::Wrapped:
            return Patch::wrapped(read_patch(r));

        case PatchKind::Children: {
            patches::Children children;
            uint32_t count = r.read_u32();
            children.patch.reserve(r.reserve_hint(count, sizeof(uint64_t) + 1));
            for (uint32_t i = 0; i < count; ++i) {
                uint64_t index = r.read_u64();
                children.patch.emplace_back(static_cast<std::size_t>(index), read_patch(r));
            }
            if (r.read_bool()) {
                children.truncate = static_cast<std::size_t>(r.read_u64());
            }
            uint32_t append_count = r.read_u32();
            children.append.reserve(r.reserve_hint(append_count, 1));
            for (uint32_t i = 0; i < append_count; ++i) {
                children.append.push_back(read_node(r));
            }
            return Patch{std::move(children)};
        }
    }
    throw std::runtime_error("Unknown patch tag: " + std::to_string(static_cast<int>(tag)));
}

Patch read_patch(ByteReader& r)
{
    uint8_t tag = r.read_u8();
    r.enter();
    Patch patch = read_patch_payload(r, tag);
    r.leave();
    return patch;
}

} // anonymous namespace

// ============================================================
// Public API
// ============================================================

ByteBuffer serialize(const Node& node)
{
    ByteWriter w;
    write_node(w, node);
    return std::move(w.buffer);
}

ByteBuffer serialize(const Patch& patch)
{
    ByteWriter w;
    write_patch(w, patch);
    return std::move(w.buffer);
}

ByteBuffer serialize(const BodyPatch& patch)
{
    ByteWriter w;
    w.write_u64(patch.id);
    write_patch(w, patch.patch);
    return std::move(w.buffer);
}

Node deserialize_node(const uint8_t* data, std::size_t size)
{
    ByteReader r(data, size);
    Node node = read_node(r);
    r.expect_end();
    return node;
}

Node deserialize_node(const ByteBuffer& buffer)
{
    return deserialize_node(buffer.data(), buffer.size());
}

Patch deserialize_patch(const uint8_t* data, std::size_t size)
{
    ByteReader r(data, size);
    Patch patch = read_patch(r);
    r.expect_end();
    return patch;
}

Patch deserialize_patch(const ByteBuffer& buffer)
{
    return deserialize_patch(buffer.data(), buffer.size());
}

BodyPatch deserialize_body_patch(const uint8_t* data, std::size_t size)
{
    ByteReader r(data, size);
    uint64_t id = r.read_u64();
    Patch patch = read_patch(r);
    r.expect_end();
    return BodyPatch{id, std::move(patch)};
}

BodyPatch deserialize_body_patch(const ByteBuffer& buffer)
{
    return deserialize_body_patch(buffer.data(), buffer.size());
}

} // namespace post_body
