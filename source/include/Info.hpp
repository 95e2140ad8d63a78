// typed view of a torrent's info dictionary

#pragma once

#include <vector>
#include <string>
#include <optional>
#include <stdexcept>
#include <cstdint>

// my headers
#include <Bencode.hpp>
#include <InfoHash.hpp>

class InfoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FileEntry {
	uint64_t length{};
	std::vector<std::string> path;
	std::optional<std::string> md5sum;
	BEncodeValue::Dict extra;			// keys we don't model, kept as-is

	bool operator==(const FileEntry&) const = default;
};

struct Info {
	std::string name;
	uint64_t piece_length{};
	std::string pieces;								// concatenated 20 byte SHA1 hashes

	std::optional<uint64_t> length;					// single-file torrents
	std::optional<std::string> md5sum;				// single-file torrents
	std::vector<FileEntry> files;					// multi-file torrents

	// OPTIONALS

	std::optional<int64_t> private_flag;
	std::optional<std::string> source;
	std::optional<std::string> update_url;

	// -- END OPTIONALS

	// Every key not listed above. Re-encoding has to reproduce the exact
	// dictionary a peer sent, otherwise the info hash would not match.
	BEncodeValue::Dict extra;

	// throws InfoError when required keys are missing or malformed
	static Info from_bencode(const BEncodeValue& value);

	// strict: the whole buffer must be one dictionary
	static Info decode(std::string_view bytes);

	BEncodeValue to_bencode() const;

	// canonical bencoding
	std::string encode() const { return bencode(to_bencode()); }

	InfoHash info_hash() const { return InfoHash::from_bencoded_info_dict(encode()); }

	uint64_t total_size() const;
	size_t piece_count() const { return pieces.size() / 20; }
	bool is_multi_file() const { return !length.has_value(); }

	bool operator==(const Info&) const = default;
};
