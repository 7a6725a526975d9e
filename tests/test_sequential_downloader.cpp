#include <gtest/gtest.h>
#include "download/SequentialDownloader.hpp"
#include "core/Errors.hpp"
#include "utils/CryptoUtils.hpp"
#include "support/FakeTransport.hpp"
#include "support/TempDir.hpp"

class SequentialDownloaderTest : public ::testing::Test {
protected:
    TempDir dir;
    std::string destination = dir.file("stream.bin");
    std::string content = make_content(100000, 5);
    FakeTransport transport;
    std::atomic<bool> cancelled{false};
    SequentialDownloader downloader{transport, cancelled};
};

TEST_F(SequentialDownloaderTest, StreamsWholeBody) {
    transport.add_mirror("http://a/file", content).supports_range = false;

    SequentialResult result = downloader.download({"http://a/file"}, destination, 100000);

    EXPECT_EQ(result.mirror, "http://a/file");
    EXPECT_EQ(result.bytes_written, 100000);
    EXPECT_EQ(result.sha256, CryptoUtils::sha256_to_hex(content));
    EXPECT_EQ(read_file(destination), content);
}

TEST_F(SequentialDownloaderTest, OverwritesStaleDestination) {
    transport.add_mirror("http://a/file", content);
    write_file(destination, std::string(200000, 'x'));

    downloader.download({"http://a/file"}, destination, 100000);
    EXPECT_EQ(read_file(destination), content);
}

TEST_F(SequentialDownloaderTest, DroppedStreamRestartsFromZeroOnNextMirror) {
    transport.add_mirror("http://a/file", content).stream_cut_at = 40000;
    transport.add_mirror("http://b/file", content);

    SequentialResult result = downloader.download({"http://a/file", "http://b/file"}, destination, 100000);

    EXPECT_EQ(result.mirror, "http://b/file");
    EXPECT_EQ(read_file(destination), content);
    EXPECT_EQ(transport.get_stream_log(), (std::vector<std::string>{"http://a/file", "http://b/file"}));
}

TEST_F(SequentialDownloaderTest, ShortBodyIsAFailure) {
    transport.add_mirror("http://a/file", content.substr(0, 99999));

    SequentialResult result;
    std::string reason;
    EXPECT_FALSE(downloader.sequential_download("http://a/file", destination, 100000, result, reason));
    EXPECT_NE(reason.find("99999"), std::string::npos);
}

TEST_F(SequentialDownloaderTest, ErrorStatusIsAFailure) {
    transport.add_mirror("http://a/file", content).stream_status = 404;

    SequentialResult result;
    std::string reason;
    EXPECT_FALSE(downloader.sequential_download("http://a/file", destination, 100000, result, reason));
    EXPECT_EQ(reason, "HTTP 404");
}

TEST_F(SequentialDownloaderTest, EveryMirrorFailing) {
    transport.add_mirror("http://a/file", content).reachable = false;
    transport.add_mirror("http://b/file", content).stream_cut_at = 10;

    EXPECT_THROW(downloader.download({"http://a/file", "http://b/file"}, destination, 100000),
                 SourceUnavailableError);
}

TEST_F(SequentialDownloaderTest, CancelStopsStreamBetweenChunks) {
    transport.add_mirror("http://a/file", content);
    transport.add_mirror("http://b/file", content);
    transport.set_stream_hook([&](size_t delivered) {
        if (delivered >= 30000) cancelled = true;
    });

    EXPECT_THROW(downloader.download({"http://a/file", "http://b/file"}, destination, 100000), TransferCancelled);

    EXPECT_EQ(transport.get_stream_log(), (std::vector<std::string>{"http://a/file"}));
    EXPECT_LT(read_file(destination).size(), content.size());
}

TEST_F(SequentialDownloaderTest, CancelledBeforeFirstMirror) {
    transport.add_mirror("http://a/file", content);
    cancelled = true;

    EXPECT_THROW(downloader.download({"http://a/file"}, destination, 100000), TransferCancelled);
    EXPECT_TRUE(transport.get_stream_log().empty());
}
