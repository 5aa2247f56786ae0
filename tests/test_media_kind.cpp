#include <catch2/catch_test_macros.hpp>

#include "media/media_kind.hpp"

TEST_CASE("classify_media", "[media]") {
    SECTION("Audio") {
        for (const char* p : {"a.mp3", "a.wav", "a.m4a", "a.ogg", "a.flac", "a.aac"}) {
            REQUIRE(classify_media(p) == MediaKind::Audio);
        }
    }

    SECTION("Video") {
        for (const char* p : {"a.mp4", "a.mov", "a.avi", "a.mkv", "a.webm", "a.flv", "a.wmv"}) {
            REQUIRE(classify_media(p) == MediaKind::Video);
        }
    }

    SECTION("CaseInsensitive") {
        REQUIRE(classify_media("/home/u/Lecture.MP4") == MediaKind::Video);
        REQUIRE(classify_media("Memo.Wav") == MediaKind::Audio);
    }

    SECTION("Unsupported") {
        REQUIRE(classify_media("notes.txt") == MediaKind::Unsupported);
        REQUIRE(classify_media("noext") == MediaKind::Unsupported);
        REQUIRE(classify_media("trailing.") == MediaKind::Unsupported);
        REQUIRE(classify_media("archive.mp4.zip") == MediaKind::Unsupported);
        REQUIRE(classify_media(".mp3") == MediaKind::Unsupported);
    }

    SECTION("ExtensionLists") {
        REQUIRE(supported_extensions().size() ==
                supported_audio_extensions().size() + supported_video_extensions().size());
    }
}
