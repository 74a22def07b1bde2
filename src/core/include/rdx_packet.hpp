#pragma once

/**
 * @file rdx_packet.hpp
 * @brief Application packets and their bencode serialisation
 *
 * A packet is a list whose first item is the packet type string
 * ("hello", "challenge", "damage-sequence", ...). Items are integers,
 * byte strings, lists or dictionaries with string keys.
 */

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

namespace rdx {

class Value {
public:
    enum class Type { INTEGER, BYTES, LIST, DICT };

    using List = std::vector<Value>;
    using Dict = std::map<std::string, Value>;

    Value();
    Value(int v);
    Value(int64_t v);
    Value(uint32_t v);
    Value(uint64_t v);
    Value(bool v);
    Value(const char* v);
    Value(std::string v);
    Value(List v);
    Value(Dict v);

    Type type() const { return type_; }
    bool is_int() const { return type_ == Type::INTEGER; }
    bool is_bytes() const { return type_ == Type::BYTES; }
    bool is_list() const { return type_ == Type::LIST; }
    bool is_dict() const { return type_ == Type::DICT; }

    // Typed access; throws ProtocolError on a type mismatch
    int64_t as_int() const;
    const std::string& as_bytes() const;
    const List& as_list() const;
    const Dict& as_dict() const;
    List& as_list();
    Dict& as_dict();

    // Dictionary helpers
    const Value* find(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    std::vector<std::string> get_string_list(const std::string& key) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Type type_;
    int64_t int_ = 0;
    std::string bytes_;
    List list_;
    Dict dict_;
};

class Packet {
public:
    Packet() = default;
    explicit Packet(std::string type);
    Packet(std::string type, std::initializer_list<Value> args);
    explicit Packet(Value::List items) : items_(std::move(items)) {}

    /// Packet type; throws ProtocolError when missing or not a string
    const std::string& type() const;

    Packet& add(Value v);

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    Value& operator[](size_t i) { return items_.at(i); }
    const Value& operator[](size_t i) const { return items_.at(i); }

    Value::List& items() { return items_; }
    const Value::List& items() const { return items_; }

    bool operator==(const Packet& other) const { return items_ == other.items_; }

private:
    Value::List items_;
};

// ===== bencode =====

std::string bencode(const Value& value);

/// Throws ProtocolError on malformed input or trailing bytes
Value bdecode(const std::string& data);

std::string encode_packet(const Packet& packet);

/// Decodes and checks that the result is a list starting with a type string
Packet decode_packet(const std::string& data);

} // namespace rdx
