// parse a .torrent file and extract its metadata

#pragma once

#include <vector>
#include <string>
#include <optional>

// my headers
#include <Bencode.hpp>
#include <Info.hpp>
#include <InfoHash.hpp>

struct Metainfo {
	std::string announce;							     // primary tracker URL (for older torrents)
	std::vector<std::vector<std::string>> announce_list; // list of tracker URLs by hierarchy

	Info info;

	// SHA1 of the info dictionary exactly as it appears in the file
	InfoHash info_hash;

	// OPTIONALS

	std::optional<std::string> comment;
	std::optional<std::string> created_by;
	std::optional<uint64_t> creation_date;				// epoch time

	// -- END OPTIONALS
};

Metainfo parse_torrent(const std::string&);

// bencoded .torrent for metadata obtained from a peer
std::string make_torrent(const Info& info, const std::vector<std::string>& trackers);
