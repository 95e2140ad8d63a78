#include <Config.hpp>
#include <InfoHash.hpp>
#include <MagnetLink.hpp>
#include <Peer.hpp>
#include <Utils.hpp>
#include <gtest/gtest.h>

#include <stdexcept>

static const char* const kHex = "a9993e364706816aba3e25717850c26c9cd0d89d";

TEST(InfoHash, parse) {
    auto hex = InfoHash::parse(kHex);
    ASSERT_TRUE(hex);
    ASSERT_EQ(hex->to_hex(), kHex);

    auto upper = InfoHash::parse("A9993E364706816ABA3E25717850C26C9CD0D89D");
    ASSERT_EQ(upper, hex);

    auto base32 = InfoHash::parse("VGMT4NSHA2AWVOR6EVYXQUGCNSONBWE5");
    ASSERT_EQ(base32, hex);

    ASSERT_FALSE(InfoHash::parse("a9993e"));
    ASSERT_FALSE(InfoHash::parse("z9993e364706816aba3e25717850c26c9cd0d89d"));
    ASSERT_FALSE(InfoHash::parse("VGMT4NSHA2AWVOR6EVYXQUGCNSONBWE1"));
}

TEST(Magnet, parse) {
    auto link = MagnetLink::parse(
        std::string("magnet:?xt=urn:btih:") + kHex +
        "&dn=Some+Name%21"
        "&tr=http%3A%2F%2Ftracker.example%2Fannounce"
        "&tr=udp%3A%2F%2Fother%3A80"
        "&x.pe=127.0.0.1%3A6881"
        "&x.pe=[::1]:6882"
        "&foo=bar");

    ASSERT_EQ(link.info_hash.to_hex(), kHex);
    ASSERT_EQ(link.name, "Some Name!");
    ASSERT_EQ(link.trackers, (std::vector<std::string>{ "http://tracker.example/announce", "udp://other:80" }));
    ASSERT_EQ(link.peers, (std::vector<std::string>{ "127.0.0.1:6881", "[::1]:6882" }));
}

TEST(Magnet, base32) {
    auto link = MagnetLink::parse("magnet:?xt=urn:btih:VGMT4NSHA2AWVOR6EVYXQUGCNSONBWE5");
    ASSERT_EQ(link.info_hash.to_hex(), kHex);
    ASSERT_FALSE(link.name);
    ASSERT_TRUE(link.trackers.empty());
}

TEST(Magnet, invalid) {
    ASSERT_THROW(MagnetLink::parse(kHex), std::invalid_argument);
    ASSERT_THROW(MagnetLink::parse("magnet:?dn=name"), std::invalid_argument);
    ASSERT_THROW(MagnetLink::parse("magnet:?xt=urn:sha1:abc"), std::invalid_argument);
    ASSERT_THROW(MagnetLink::parse("magnet:?xt=urn:btih:1234"), std::invalid_argument);
    ASSERT_THROW(MagnetLink::parse(std::string("magnet:?xt=urn:btih:") + kHex + "&dn=%4"), std::invalid_argument);
    ASSERT_THROW(MagnetLink::parse(std::string("magnet:?xt=urn:btih:") + kHex + "&dn=%zz"), std::invalid_argument);
}

TEST(Utils, percent_decode) {
    ASSERT_EQ(percent_decode("a%20b+c"), "a b c");
    ASSERT_EQ(percent_decode("%41"), "A");
    ASSERT_EQ(percent_decode(""), "");
    ASSERT_THROW(percent_decode("%"), std::invalid_argument);
    ASSERT_THROW(percent_decode("%4"), std::invalid_argument);
}

TEST(Utils, peer_id) {
    auto id = generate_peer_id();
    ASSERT_EQ(as_string_view(id).substr(0, 8), "-MS0001-");
    for (size_t i = 8; i < id.size(); ++i) {
        ASSERT_TRUE(id[i] >= '0' && id[i] <= '9');
    }
}

TEST(Peer, parse) {
    auto v4 = Peer::parse("127.0.0.1:6881");
    ASSERT_EQ(v4.ip(), "127.0.0.1");
    ASSERT_EQ(v4.port(), 6881);
    ASSERT_EQ(v4.to_string(), "127.0.0.1:6881");

    auto v6 = Peer::parse("[::1]:6882");
    ASSERT_TRUE(v6.addr().is_v6());
    ASSERT_EQ(v6.port(), 6882);
    ASSERT_EQ(v6.to_string(), "[::1]:6882");

    ASSERT_EQ(Peer::parse("127.0.0.1:1"), Peer(boost::asio::ip::make_address("127.0.0.1"), 1));

    ASSERT_THROW(Peer::parse("127.0.0.1"), std::invalid_argument);
    ASSERT_THROW(Peer::parse("127.0.0.1:"), std::invalid_argument);
    ASSERT_THROW(Peer::parse(":80"), std::invalid_argument);
    ASSERT_THROW(Peer::parse("127.0.0.1:0"), std::invalid_argument);
    ASSERT_THROW(Peer::parse("127.0.0.1:70000"), std::invalid_argument);
    ASSERT_THROW(Peer::parse("127.0.0.1:80x"), std::invalid_argument);
}

namespace {

Config parse(std::vector<std::string> args) {
    args.insert(args.begin(), "metaswap");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(Config, fetch) {
    auto config = parse({ "fetch", kHex, "--peer", "127.0.0.1:1", "--peer", "[::1]:2",
                          "--output", "out.torrent", "--timeout", "250", "--connect-timeout", "100", "-v" });
    ASSERT_EQ(config.command, Config::Command::Fetch);
    ASSERT_EQ(config.target, kHex);
    ASSERT_EQ(config.peers.size(), 2);
    ASSERT_EQ(config.output, "out.torrent");
    ASSERT_EQ(config.read_timeout.count(), 250);
    ASSERT_EQ(config.connect_timeout.count(), 100);
    ASSERT_TRUE(config.verbose);

    auto options = config.session_options();
    ASSERT_EQ(options.read_timeout.count(), 250);
    ASSERT_EQ(options.connect_timeout.count(), 100);
}

TEST(Config, defaults) {
    auto config = parse({ "seed", "file.torrent" });
    ASSERT_EQ(config.command, Config::Command::Seed);
    ASSERT_EQ(config.port, 31616);
    ASSERT_EQ(config.connect_timeout.count(), 5000);
    ASSERT_EQ(config.read_timeout.count(), 10000);
    ASSERT_FALSE(config.verbose);

    ASSERT_EQ(parse({ "seed", "file.torrent", "--port", "7000" }).port, 7000);
    ASSERT_EQ(parse({}).command, Config::Command::Help);
    ASSERT_EQ(parse({ "--help" }).command, Config::Command::Help);
}

TEST(Config, invalid) {
    ASSERT_THROW(parse({ "frobnicate" }), std::invalid_argument);
    ASSERT_THROW(parse({ "fetch" }), std::invalid_argument);
    ASSERT_THROW(parse({ "fetch", kHex, "--peer" }), std::invalid_argument);
    ASSERT_THROW(parse({ "fetch", kHex, "--timeout", "soon" }), std::invalid_argument);
    ASSERT_THROW(parse({ "fetch", kHex, "--timeout", "0" }), std::invalid_argument);
    ASSERT_THROW(parse({ "fetch", kHex, "--port", "1" }), std::invalid_argument);
    ASSERT_THROW(parse({ "seed", "a.torrent", "--port", "65536" }), std::invalid_argument);
    ASSERT_THROW(parse({ "seed", "a.torrent", "b.torrent" }), std::invalid_argument);
    ASSERT_THROW(parse({ "infohash", "a.torrent", "--bogus" }), std::invalid_argument);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
