#include <Info.hpp>

namespace {

uint64_t require_length(const BEncodeValue::Dict& dict, const std::string& key, const char* what) {
    auto it = dict.find(key);
    if (it == dict.end() || !it->second.is_int())
        throw InfoError(std::string(what) + ": missing '" + key + "'");
    if (it->second.as_int() < 0)
        throw InfoError(std::string(what) + ": negative '" + key + "'");
    return static_cast<uint64_t>(it->second.as_int());
}

std::optional<std::string> optional_string(const BEncodeValue::Dict& dict, const std::string& key) {
    auto it = dict.find(key);
    if (it == dict.end()) return std::nullopt;
    if (!it->second.is_string()) throw InfoError("Info: '" + key + "' is not a string");
    return it->second.as_string();
}

FileEntry parse_file(const BEncodeValue& fval) {
    if (!fval.is_dict()) throw InfoError("Info: file entry is not a dictionary");
    const auto& fdict = fval.as_dict();

    FileEntry file;
    file.length = require_length(fdict, "length", "File entry");

    // Path (list of strings)
    auto path_it = fdict.find("path");
    if (path_it == fdict.end() || !path_it->second.is_list() || path_it->second.as_list().empty())
        throw InfoError("File entry: missing 'path'");
    for (const auto& component : path_it->second.as_list()) {
        if (!component.is_string()) throw InfoError("File entry: path component is not a string");
        file.path.push_back(component.as_string());
    }

    file.md5sum = optional_string(fdict, "md5sum");

    for (const auto& [key, value] : fdict) {
        if (key != "length" && key != "path" && key != "md5sum") file.extra.emplace(key, value);
    }
    return file;
}

} // namespace

Info Info::from_bencode(const BEncodeValue& value) {
    if (!value.is_dict()) throw InfoError("Info is not a dictionary");
    const auto& dict = value.as_dict();

    Info info{};

    // Name
    auto name = optional_string(dict, "name");
    if (!name) throw InfoError("Info: missing 'name'");
    info.name = std::move(*name);

    // Piece length
    info.piece_length = require_length(dict, "piece length", "Info");
    if (info.piece_length == 0) throw InfoError("Info: zero 'piece length'");

    // Pieces (concatenated SHA1 hashes)
    auto pieces = optional_string(dict, "pieces");
    if (!pieces) throw InfoError("Info: missing 'pieces'");
    if (pieces->size() % 20 != 0) throw InfoError("Info: 'pieces' is not a multiple of 20 bytes");
    info.pieces = std::move(*pieces);

    // Files
    auto files_it = dict.find("files");
    auto length_it = dict.find("length");
    if (files_it != dict.end() && length_it != dict.end())
        throw InfoError("Info: both 'length' and 'files' present");

    if (files_it != dict.end()) {
        // Multi-file torrent
        if (!files_it->second.is_list()) throw InfoError("Info: 'files' is not a list");
        for (const auto& fval : files_it->second.as_list()) {
            info.files.push_back(parse_file(fval));
        }
    }
    else {
        // Single-file torrent
        info.length = require_length(dict, "length", "Info");
        info.md5sum = optional_string(dict, "md5sum");
    }

    // Optionals
    auto private_it = dict.find("private");
    if (private_it != dict.end()) {
        if (!private_it->second.is_int()) throw InfoError("Info: 'private' is not an integer");
        info.private_flag = private_it->second.as_int();
    }
    info.source = optional_string(dict, "source");
    info.update_url = optional_string(dict, "update-url");

    static const char* const modelled[] = {
        "name", "piece length", "pieces", "files", "length", "md5sum", "private", "source", "update-url"
    };
    for (const auto& [key, val] : dict) {
        bool known = false;
        for (const char* k : modelled) known = known || key == k;

        // md5sum is only a field of single-file torrents, anywhere else it's opaque
        if (key == "md5sum" && info.is_multi_file()) known = false;

        if (!known) info.extra.emplace(key, val);
    }

    return info;
}

Info Info::decode(std::string_view bytes) {
    BEncodeParser parser(bytes);
    return from_bencode(parser.parse_all());
}

BEncodeValue Info::to_bencode() const {
    BEncodeValue::Dict dict = extra;

    dict.insert_or_assign("name", name);
    dict.insert_or_assign("piece length", piece_length);
    dict.insert_or_assign("pieces", pieces);

    if (length) {
        dict.insert_or_assign("length", *length);
        if (md5sum) dict.insert_or_assign("md5sum", *md5sum);
    }
    else {
        BEncodeValue::List list;
        for (const auto& file : files) {
            BEncodeValue::Dict fdict = file.extra;
            BEncodeValue::List path(file.path.begin(), file.path.end());
            fdict.insert_or_assign("length", file.length);
            fdict.insert_or_assign("path", std::move(path));
            if (file.md5sum) fdict.insert_or_assign("md5sum", *file.md5sum);
            list.push_back(std::move(fdict));
        }
        dict.insert_or_assign("files", std::move(list));
    }

    if (private_flag) dict.insert_or_assign("private", *private_flag);
    if (source) dict.insert_or_assign("source", *source);
    if (update_url) dict.insert_or_assign("update-url", *update_url);

    return dict;
}

uint64_t Info::total_size() const {
    if (length) return *length;

    uint64_t total{};
    for (const auto& file : files) total += file.length;
    return total;
}
