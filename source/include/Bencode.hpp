#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <type_traits>

class BencodeError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct BEncodeValue {
	using List = std::vector<BEncodeValue>;
	using Dict = std::map<std::string, BEncodeValue>;

	std::variant<int64_t, std::string, List, Dict> value;

	BEncodeValue() : value(int64_t{}) {}
	template <typename T> requires std::is_integral_v<T>
	BEncodeValue(T i) : value(static_cast<int64_t>(i)) {}
	BEncodeValue(std::string s) : value(std::move(s)) {}
	BEncodeValue(const char* s) : value(std::string(s)) {}
	BEncodeValue(List l) : value(std::move(l)) {}
	BEncodeValue(Dict d) : value(std::move(d)) {}

	bool is_int() const { return std::holds_alternative<int64_t>(value); }
	bool is_string() const { return std::holds_alternative<std::string>(value); }
	bool is_list() const { return std::holds_alternative<List>(value); }
	bool is_dict() const { return std::holds_alternative<Dict>(value); }

	int64_t as_int() const { return std::get<int64_t>(value); }
	const std::string& as_string() const { return std::get<std::string>(value); }
	const List& as_list() const { return std::get<List>(value); }
	const Dict& as_dict() const { return std::get<Dict>(value); }

	// nullptr when not a dict or the key is missing
	const BEncodeValue* find(const std::string& key) const;

	bool operator==(const BEncodeValue&) const = default;
};

class BEncodeParser {
public:
	explicit BEncodeParser(std::string_view input);

	// parses one value, leaving anything after it untouched
	BEncodeValue parse();

	// parses one value that must span the whole input
	BEncodeValue parse_all();

	size_t position() const { return pos; }

	std::pair<size_t, size_t> get_info_start_end() { return { _info_start, _info_end }; }

private:
	BEncodeValue parse_value();
	int64_t parse_int();
	std::string parse_string();
	BEncodeValue::List parse_list();
	BEncodeValue::Dict parse_dict();

	std::string_view _data;
	size_t pos{};
	size_t depth{};

	size_t _info_start{}, _info_end{}; // positions of the "info" dictionary in the original bencoded string
};

// Canonical encoding: dict keys come out in byte order because Dict is a std::map.
std::string bencode(const BEncodeValue& value);

std::optional<int64_t> dict_int(const BEncodeValue::Dict& dict, const std::string& key);
std::optional<std::string> dict_string(const BEncodeValue::Dict& dict, const std::string& key);
