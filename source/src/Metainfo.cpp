#include <Metainfo.hpp>
#include <Log.hpp>

Metainfo parse_torrent(const std::string& in) {

	BEncodeParser parser(in);

	auto root = parser.parse_all();
	if (!root.is_dict()) throw InfoError("Torrent file is not a dictionary");
	const auto& dict = root.as_dict();

    Metainfo meta{};

    // Required: announce
    auto it = dict.find("announce");
    if (it != dict.end() && it->second.is_string()) {
        meta.announce = it->second.as_string();
		APP_LOG("Found announce URL: ", meta.announce);
    }

    // Optional: announce-list
    it = dict.find("announce-list");
    if (it != dict.end() && it->second.is_list()) {
        for (const auto& tier_val : it->second.as_list()) {
            std::vector<std::string> tier;
            if (tier_val.is_list()) {
                for (const auto& tracker : tier_val.as_list()) {
                    if (tracker.is_string()) tier.push_back(tracker.as_string());
                }
            }
            if (!tier.empty()) meta.announce_list.push_back(std::move(tier));
        }
    }

    // Info dictionary (required)
    it = dict.find("info");
    if (it == dict.end() || !it->second.is_dict())
        throw InfoError("Missing info dictionary");
    meta.info = Info::from_bencode(it->second);

    // Optionals
    meta.comment = dict_string(dict, "comment");
    meta.created_by = dict_string(dict, "created by");
    if (auto date = dict_int(dict, "creation date"); date && *date >= 0)
        meta.creation_date = static_cast<uint64_t>(*date);

    // Info hash (SHA1 of bencoded info dictionary)

	const auto& [start, end] = parser.get_info_start_end();

	meta.info_hash = InfoHash::from_bencoded_info_dict(std::string_view(in).substr(start, end - start));

    return meta;
}

std::string make_torrent(const Info& info, const std::vector<std::string>& trackers) {
    BEncodeValue::Dict dict;

    if (!trackers.empty()) {
        dict.insert_or_assign("announce", trackers.front());

        // one tracker per tier, in the order they were given
        BEncodeValue::List tiers;
        for (const auto& url : trackers) tiers.push_back(BEncodeValue::List{ url });
        dict.insert_or_assign("announce-list", std::move(tiers));
    }

    dict.insert_or_assign("info", info.to_bencode());

    return bencode(dict);
}
