#include "Bencode.hpp"

#include <cctype>

namespace {

constexpr size_t max_depth = 256;

void encode_into(std::string& out, const BEncodeValue& value) {
	if (value.is_int()) {
		out += 'i';
		out += std::to_string(value.as_int());
		out += 'e';
	}
	else if (value.is_string()) {
		const auto& s = value.as_string();
		out += std::to_string(s.size());
		out += ':';
		out += s;
	}
	else if (value.is_list()) {
		out += 'l';
		for (const auto& item : value.as_list()) encode_into(out, item);
		out += 'e';
	}
	else {
		out += 'd';
		for (const auto& [key, item] : value.as_dict()) {
			out += std::to_string(key.size());
			out += ':';
			out += key;
			encode_into(out, item);
		}
		out += 'e';
	}
}

} // namespace

const BEncodeValue* BEncodeValue::find(const std::string& key) const {
	if (!is_dict()) return nullptr;
	const auto& dict = as_dict();
	auto it = dict.find(key);
	return it == dict.end() ? nullptr : &it->second;
}

BEncodeParser::BEncodeParser(std::string_view input) : _data(input), pos(0) {}

BEncodeValue BEncodeParser::parse() {
	return parse_value();
}

BEncodeValue BEncodeParser::parse_all() {
	auto value = parse_value();
	if (pos != _data.size()) {
		throw BencodeError("Trailing data after value at offset " + std::to_string(pos));
	}
	return value;
}

BEncodeValue BEncodeParser::parse_value() {
    if (pos >= _data.size()) {
        throw BencodeError("Unexpected end of input");
    }
    if (depth >= max_depth) {
        throw BencodeError("Nesting too deep");
    }

    char c = _data[pos];

    if (c == 'i') {
        return BEncodeValue{ parse_int() };
    }
    else if (c == 'l') {
        ++pos;  // skip 'l'
        ++depth;
        auto list = parse_list();
        --depth;
        return BEncodeValue{ std::move(list) };
    }
    else if (c == 'd') {
        ++pos;  // skip 'd'
        ++depth;
        auto dict = parse_dict();
        --depth;
        return BEncodeValue{ std::move(dict) };
    }
    else if (std::isdigit(static_cast<unsigned char>(c))) {
        return BEncodeValue{ parse_string() };
    }
    else {
        throw BencodeError(std::string("Invalid BEncode token: ") + c);
    }
}

int64_t BEncodeParser::parse_int() {
    if (_data[pos] != 'i') throw BencodeError("Expected 'i' at start of integer");
    ++pos;  // skip 'i'

    size_t end = _data.find('e', pos);
    if (end == std::string_view::npos) throw BencodeError("Missing 'e' for integer");

    std::string number(_data.substr(pos, end - pos));
    pos = end + 1;  // move past 'e'

    // i-0e and leading zeros have no canonical form
    size_t digits = (!number.empty() && number[0] == '-') ? 1 : 0;
    if (number.size() == digits) throw BencodeError("Empty integer");
    for (size_t i = digits; i < number.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(number[i]))) throw BencodeError("Invalid integer: " + number);
    }
    if (number[digits] == '0' && (number.size() > digits + 1 || digits == 1)) {
        throw BencodeError("Non-canonical integer: " + number);
    }

    try {
        return std::stoll(number);
    } catch (const std::out_of_range&) {
        throw BencodeError("Integer out of range: " + number);
    }
}

std::string BEncodeParser::parse_string() {
    size_t colon = _data.find(':', pos);
    if (colon == std::string_view::npos) throw BencodeError("Missing ':' in string");

    std::string len_str(_data.substr(pos, colon - pos));
    for (char c : len_str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) throw BencodeError("Invalid string length: " + len_str);
    }

    size_t len{};
    try {
        len = std::stoull(len_str);
    } catch (const std::out_of_range&) {
        throw BencodeError("String length out of range: " + len_str);
    }

    pos = colon + 1;  // skip ':'

    if (len > _data.size() - pos) throw BencodeError("String length exceeds input");

    std::string result(_data.substr(pos, len));
    pos += len;  // advance past the string

    return result;
}

BEncodeValue::List BEncodeParser::parse_list() {
    BEncodeValue::List list;
    while (pos < _data.size() && _data[pos] != 'e') {
        list.push_back(parse_value());
    }
    if (pos >= _data.size() || _data[pos] != 'e') throw BencodeError("Missing 'e' at end of list");
    ++pos;  // skip 'e'
    return list;
}

BEncodeValue::Dict BEncodeParser::parse_dict() {
    BEncodeValue::Dict dict;
    while (pos < _data.size() && _data[pos] != 'e') {
        if (!std::isdigit(static_cast<unsigned char>(_data[pos]))) throw BencodeError("Dictionary key must be a string");
        std::string key = parse_string();
		size_t val_start = pos;
        BEncodeValue value = parse_value();
		size_t val_end = pos;

        if (key == "info" && depth == 1) {
			_info_start = val_start;
			_info_end = val_end;
        }
        dict.insert_or_assign(std::move(key), std::move(value));
    }
    if (pos >= _data.size() || _data[pos] != 'e') throw BencodeError("Missing 'e' at end of dict");
    ++pos;  // skip 'e'
    return dict;
}

std::string bencode(const BEncodeValue& value) {
	std::string out;
	encode_into(out, value);
	return out;
}

std::optional<int64_t> dict_int(const BEncodeValue::Dict& dict, const std::string& key) {
	auto it = dict.find(key);
	if (it == dict.end() || !it->second.is_int()) return std::nullopt;
	return it->second.as_int();
}

std::optional<std::string> dict_string(const BEncodeValue::Dict& dict, const std::string& key) {
	auto it = dict.find(key);
	if (it == dict.end() || !it->second.is_string()) return std::nullopt;
	return it->second.as_string();
}
