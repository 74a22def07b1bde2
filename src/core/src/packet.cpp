#include "rdx_packet.hpp"
#include "rdx_errors.hpp"

#include <cctype>

namespace rdx {

// ===== Value =====

Value::Value() : type_(Type::BYTES) {}
Value::Value(int v) : type_(Type::INTEGER), int_(v) {}
Value::Value(int64_t v) : type_(Type::INTEGER), int_(v) {}
Value::Value(uint32_t v) : type_(Type::INTEGER), int_(v) {}
Value::Value(uint64_t v) : type_(Type::INTEGER), int_(static_cast<int64_t>(v)) {}
Value::Value(bool v) : type_(Type::INTEGER), int_(v ? 1 : 0) {}
Value::Value(const char* v) : type_(Type::BYTES), bytes_(v ? v : "") {}
Value::Value(std::string v) : type_(Type::BYTES), bytes_(std::move(v)) {}
Value::Value(List v) : type_(Type::LIST), list_(std::move(v)) {}
Value::Value(Dict v) : type_(Type::DICT), dict_(std::move(v)) {}

int64_t Value::as_int() const {
    if (type_ != Type::INTEGER) throw ProtocolError("packet item is not an integer");
    return int_;
}

const std::string& Value::as_bytes() const {
    if (type_ != Type::BYTES) throw ProtocolError("packet item is not a string");
    return bytes_;
}

const Value::List& Value::as_list() const {
    if (type_ != Type::LIST) throw ProtocolError("packet item is not a list");
    return list_;
}

const Value::Dict& Value::as_dict() const {
    if (type_ != Type::DICT) throw ProtocolError("packet item is not a dictionary");
    return dict_;
}

Value::List& Value::as_list() {
    if (type_ != Type::LIST) throw ProtocolError("packet item is not a list");
    return list_;
}

Value::Dict& Value::as_dict() {
    if (type_ != Type::DICT) throw ProtocolError("packet item is not a dictionary");
    return dict_;
}

const Value* Value::find(const std::string& key) const {
    if (type_ != Type::DICT) return nullptr;
    auto it = dict_.find(key);
    return it == dict_.end() ? nullptr : &it->second;
}

std::string Value::get_string(const std::string& key, const std::string& def) const {
    const Value* v = find(key);
    return (v && v->is_bytes()) ? v->bytes_ : def;
}

int64_t Value::get_int(const std::string& key, int64_t def) const {
    const Value* v = find(key);
    return (v && v->is_int()) ? v->int_ : def;
}

std::vector<std::string> Value::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Value* v = find(key);
    if (!v || !v->is_list()) return out;
    for (const auto& item : v->list_) {
        if (item.is_bytes()) out.push_back(item.bytes_);
    }
    return out;
}

bool Value::operator==(const Value& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::INTEGER: return int_ == other.int_;
        case Type::BYTES:   return bytes_ == other.bytes_;
        case Type::LIST:    return list_ == other.list_;
        case Type::DICT:    return dict_ == other.dict_;
    }
    return false;
}

// ===== Packet =====

Packet::Packet(std::string type) {
    items_.emplace_back(std::move(type));
}

Packet::Packet(std::string type, std::initializer_list<Value> args) {
    items_.reserve(args.size() + 1);
    items_.emplace_back(std::move(type));
    for (const auto& v : args) items_.push_back(v);
}

const std::string& Packet::type() const {
    if (items_.empty() || !items_[0].is_bytes()) {
        throw ProtocolError("packet has no type");
    }
    return items_[0].as_bytes();
}

Packet& Packet::add(Value v) {
    items_.push_back(std::move(v));
    return *this;
}

// ===== bencode =====

namespace {

void encode_into(const Value& v, std::string& out) {
    switch (v.type()) {
        case Value::Type::INTEGER:
            out += 'i';
            out += std::to_string(v.as_int());
            out += 'e';
            break;
        case Value::Type::BYTES: {
            const auto& s = v.as_bytes();
            out += std::to_string(s.size());
            out += ':';
            out += s;
            break;
        }
        case Value::Type::LIST:
            out += 'l';
            for (const auto& item : v.as_list()) encode_into(item, out);
            out += 'e';
            break;
        case Value::Type::DICT:
            // std::map keeps keys in the byte order bencode requires
            out += 'd';
            for (const auto& kv : v.as_dict()) {
                out += std::to_string(kv.first.size());
                out += ':';
                out += kv.first;
                encode_into(kv.second, out);
            }
            out += 'e';
            break;
    }
}

class Decoder {
public:
    explicit Decoder(const std::string& data) : data_(data) {}

    Value parse(int depth = 0) {
        if (depth > kMaxDepth) throw ProtocolError("bencode nesting too deep");
        char c = peek();
        if (c == 'i') {
            ++pos_;
            int64_t v = parse_int('e');
            return Value(v);
        }
        if (c == 'l') {
            ++pos_;
            Value::List list;
            while (peek() != 'e') list.push_back(parse(depth + 1));
            ++pos_;
            return Value(std::move(list));
        }
        if (c == 'd') {
            ++pos_;
            Value::Dict dict;
            while (peek() != 'e') {
                std::string key = parse_string();
                dict[key] = parse(depth + 1);
            }
            ++pos_;
            return Value(std::move(dict));
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            return Value(parse_string());
        }
        throw ProtocolError(std::string("invalid bencode token '") + c + "'");
    }

    bool done() const { return pos_ == data_.size(); }

private:
    static constexpr int kMaxDepth = 64;

    char peek() const {
        if (pos_ >= data_.size()) throw ProtocolError("truncated bencode data");
        return data_[pos_];
    }

    int64_t parse_int(char terminator) {
        size_t end = data_.find(terminator, pos_);
        if (end == std::string::npos || end == pos_) {
            throw ProtocolError("invalid bencode integer");
        }
        std::string text = data_.substr(pos_, end - pos_);
        size_t start = (text[0] == '-') ? 1 : 0;
        if (start == text.size()) throw ProtocolError("invalid bencode integer");
        for (size_t i = start; i < text.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                throw ProtocolError("invalid bencode integer");
            }
        }
        pos_ = end + 1;
        try {
            return std::stoll(text);
        } catch (const std::out_of_range&) {
            throw ProtocolError("bencode integer out of range");
        }
    }

    std::string parse_string() {
        int64_t len = parse_int(':');
        if (len < 0 || static_cast<uint64_t>(len) > data_.size() - pos_) {
            throw ProtocolError("invalid bencode string length");
        }
        std::string s = data_.substr(pos_, static_cast<size_t>(len));
        pos_ += static_cast<size_t>(len);
        return s;
    }

    const std::string& data_;
    size_t pos_ = 0;
};

} // namespace

std::string bencode(const Value& value) {
    std::string out;
    encode_into(value, out);
    return out;
}

Value bdecode(const std::string& data) {
    Decoder decoder(data);
    Value v = decoder.parse();
    if (!decoder.done()) throw ProtocolError("trailing bytes after bencode value");
    return v;
}

std::string encode_packet(const Packet& packet) {
    return bencode(Value(packet.items()));
}

Packet decode_packet(const std::string& data) {
    Value v = bdecode(data);
    if (!v.is_list()) throw ProtocolError("packet is not a list");
    Packet packet(std::move(v.as_list()));
    packet.type();
    return packet;
}

} // namespace rdx
