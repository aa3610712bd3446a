/**
 * @file PlaylistFileServiceTest.cpp
 * @brief M3U directory service: parsing, paging, sessions and feedback
 */

#include "PlaylistFileService.h"

#include "Fakes.h"

#include <gtest/gtest.h>

#include <fstream>

namespace {

void writeFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

SessionToken login(PlaylistFileService& service, const std::string& user = "alice",
                   const std::string& password = "") {
    SessionToken token;
    Status status = service.authenticate(Credentials{user, password}, token);
    EXPECT_TRUE(status.ok()) << status;
    return token;
}

} // namespace

TEST(PlaylistFileServiceTest, ParseExtendedM3u) {
    const std::string text =
        "#EXTM3U\n"
        "#EXTINF:215,Miles Davis - So What\n"
        "#EXTALB:Kind of Blue\n"
        "music/so_what.mp3\n"
        "\n"
        "# a comment\n"
        "http://radio.example.com/stream/42.aac?token=x\r\n"
        "/abs/Blue in Green.MP3\n";

    auto tracks = PlaylistFileService::parseM3u(text, "/lib/jazz", "jazz");
    ASSERT_EQ(tracks.size(), 3u);

    EXPECT_EQ(tracks[0].artist, "Miles Davis");
    EXPECT_EQ(tracks[0].title, "So What");
    EXPECT_EQ(tracks[0].album, "Kind of Blue");
    EXPECT_EQ(tracks[0].duration, std::chrono::seconds(215));
    EXPECT_EQ(tracks[0].audioUrl, "/lib/jazz/music/so_what.mp3");
    EXPECT_EQ(tracks[0].encoding, AudioEncoding::MP3);
    EXPECT_EQ(tracks[0].stationId, "jazz");

    EXPECT_EQ(tracks[1].audioUrl, "http://radio.example.com/stream/42.aac?token=x");
    EXPECT_EQ(tracks[1].encoding, AudioEncoding::AAC_ADTS);
    EXPECT_EQ(tracks[1].title, "42");
    EXPECT_EQ(tracks[1].artist, "Unknown artist");

    EXPECT_EQ(tracks[2].title, "Blue in Green");
    EXPECT_EQ(tracks[2].encoding, AudioEncoding::MP3);

    EXPECT_EQ(tracks[0].id, PlaylistFileService::trackIdFor("/lib/jazz/music/so_what.mp3"));
    EXPECT_EQ(tracks[0].id.size(), 16u);
    EXPECT_NE(tracks[0].id, tracks[1].id);
}

TEST(PlaylistFileServiceTest, MissingDirectory) {
    PlaylistFileService service("/nonexistent/stationplay/dir");
    EXPECT_EQ(service.load().code, ErrorCode::SERVICE_ERROR);
}

TEST(PlaylistFileServiceTest, StationsAndQuickMix) {
    TempDir dir("stations");
    writeFile(dir.path() / "Late_Night_Jazz.m3u", "a.mp3\nb.mp3\n");
    writeFile(dir.path() / "ambient.m3u8", "c.mp3\n");
    writeFile(dir.path() / "notes.txt", "not a playlist\n");

    PlaylistFileService service(dir.path());
    ASSERT_TRUE(service.load().ok());
    SessionToken token = login(service);

    std::vector<Station> stations;
    ASSERT_TRUE(service.listStations(token, stations).ok());
    ASSERT_EQ(stations.size(), 3u);
    EXPECT_EQ(stations[0].id, "Late_Night_Jazz");
    EXPECT_EQ(stations[0].name, "Late Night Jazz");
    EXPECT_EQ(stations[1].id, "ambient");
    EXPECT_EQ(stations[2].id, PlaylistFileService::QUICKMIX_ID);
    EXPECT_TRUE(stations[2].isQuickMix);

    // Interleaved a, c, b
    std::vector<Track> page;
    ASSERT_TRUE(service.getPlaylist(token, stations[2], page).ok());
    ASSERT_EQ(page.size(), 3u);
    EXPECT_EQ(page[0].title, "a");
    EXPECT_EQ(page[1].title, "c");
    EXPECT_EQ(page[2].title, "b");
}

TEST(PlaylistFileServiceTest, PagesWrapAround) {
    TempDir dir("stations");
    writeFile(dir.path() / "rock.m3u", "1.mp3\n2.mp3\n3.mp3\n");

    PlaylistFileService::Options options;
    options.pageSize = 2;
    PlaylistFileService service(dir.path(), options);
    ASSERT_TRUE(service.load().ok());
    SessionToken token = login(service);

    Station rock{"rock", "rock", false};
    std::vector<Track> page;
    ASSERT_TRUE(service.getPlaylist(token, rock, page).ok());
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].title, "1");
    EXPECT_EQ(page[1].title, "2");

    ASSERT_TRUE(service.getPlaylist(token, rock, page).ok());
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].title, "3");
    EXPECT_EQ(page[1].title, "1");

    Station missing{"missing", "missing", false};
    EXPECT_EQ(service.getPlaylist(token, missing, page).code, ErrorCode::SERVICE_ERROR);
}

TEST(PlaylistFileServiceTest, CredentialsFile) {
    TempDir dir("stations");
    writeFile(dir.path() / "rock.m3u", "1.mp3\n");
    writeFile(dir.path() / "credentials", "# accounts\nalice:hunter2\n");

    PlaylistFileService service(dir.path());
    ASSERT_TRUE(service.load().ok());

    SessionToken token;
    EXPECT_EQ(service.authenticate(Credentials{"alice", "wrong"}, token).code,
              ErrorCode::INVALID_CREDENTIALS);
    EXPECT_EQ(service.authenticate(Credentials{"bob", "hunter2"}, token).code,
              ErrorCode::INVALID_CREDENTIALS);
    EXPECT_EQ(service.authenticate(Credentials{"", ""}, token).code,
              ErrorCode::INVALID_CREDENTIALS);
    EXPECT_TRUE(service.authenticate(Credentials{"alice", "hunter2"}, token).ok());
}

TEST(PlaylistFileServiceTest, SessionExpiry) {
    TempDir dir("stations");
    writeFile(dir.path() / "rock.m3u", "1.mp3\n");

    PlaylistFileService::Options options;
    options.sessionLifetime = std::chrono::seconds(0);
    PlaylistFileService service(dir.path(), options);
    ASSERT_TRUE(service.load().ok());

    std::vector<Station> stations;
    EXPECT_EQ(service.listStations(SessionToken(), stations).code, ErrorCode::NOT_AUTHENTICATED);

    SessionToken token = login(service);
    EXPECT_EQ(service.listStations(token, stations).code, ErrorCode::SESSION_EXPIRED);
}

TEST(PlaylistFileServiceTest, RatingsAndTiredMarksShowInPages) {
    TempDir dir("stations");
    writeFile(dir.path() / "rock.m3u", "1.mp3\n2.mp3\n");

    PlaylistFileService service(dir.path());
    ASSERT_TRUE(service.load().ok());
    SessionToken token = login(service);

    Station rock{"rock", "rock", false};
    std::vector<Track> page;
    ASSERT_TRUE(service.getPlaylist(token, rock, page).ok());
    ASSERT_EQ(page.size(), 2u);

    ASSERT_TRUE(service.rateTrack(token, page[0], Rating::THUMBS_UP).ok());
    ASSERT_TRUE(service.markTired(token, page[1]).ok());
    EXPECT_EQ(service.ratingOf(page[0].id), Rating::THUMBS_UP);

    std::vector<Track> next;
    ASSERT_TRUE(service.getPlaylist(token, rock, next).ok());
    ASSERT_EQ(next.size(), 2u);
    EXPECT_EQ(next[0].rating, Rating::THUMBS_UP);
    EXPECT_TRUE(next[1].isTired());

    ASSERT_TRUE(service.rateTrack(token, page[0], Rating::UNRATED).ok());
    EXPECT_EQ(service.ratingOf(page[0].id), Rating::UNRATED);
}

TEST(PlaylistFileServiceTest, DownloadLocalFiles) {
    TempDir dir("stations");
    writeFile(dir.path() / "song.mp3", "ID3-fake-audio");
    writeFile(dir.path() / "rock.m3u", "song.mp3\nmissing.mp3\n");

    PlaylistFileService service(dir.path());
    ASSERT_TRUE(service.load().ok());
    SessionToken token = login(service);

    std::vector<Track> page;
    ASSERT_TRUE(service.getPlaylist(token, Station{"rock", "rock", false}, page).ok());
    ASSERT_EQ(page.size(), 2u);

    CancelToken cancel;
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(service.downloadTrackAudio(page[0].audioUrl, cancel, bytes).ok());
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "ID3-fake-audio");

    bytes.clear();
    ASSERT_TRUE(service.downloadTrackAudio("file://" + page[0].audioUrl, cancel, bytes).ok());
    EXPECT_EQ(bytes.size(), 14u);

    Status missing = service.downloadTrackAudio(page[1].audioUrl, cancel, bytes);
    EXPECT_EQ(missing.code, ErrorCode::HTTP_CLIENT_ERROR);
    EXPECT_FALSE(isTransient(missing.code));
}
