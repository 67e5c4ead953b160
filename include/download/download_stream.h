// DownloadStream - lazy, single-pass sequence of response body chunks.
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "hub/hub_error.h"

namespace hubcache {

constexpr std::chrono::milliseconds kDefaultStreamChunkTimeout{30000};
constexpr size_t kDefaultStreamQueueChunks = 64;

// A receiver thread pushes body chunks into a bounded queue; next() pops them.
// next() waits at most chunk_timeout for each chunk, after which the stream ends
// with Timeout. cancel() or destruction stops the client (closing the socket)
// and joins the receiver.
class DownloadStream {
public:
    DownloadStream(std::unique_ptr<httplib::Client> client,
                   std::string path,
                   httplib::Headers headers,
                   std::chrono::milliseconds chunk_timeout = kDefaultStreamChunkTimeout,
                   size_t max_queued_chunks = kDefaultStreamQueueChunks);
    // Already-failed stream; next() returns false immediately.
    explicit DownloadStream(HubError error);
    ~DownloadStream();

    DownloadStream(const DownloadStream&) = delete;
    DownloadStream& operator=(const DownloadStream&) = delete;

    // false when the stream is exhausted, failed, timed out or was cancelled.
    bool next(std::string& chunk);
    void cancel();

    HubError error() const;
    int status() const;
    size_t bytesReceived() const;

private:
    void run(std::string path, httplib::Headers headers);
    void stop(HubError reason);

    std::unique_ptr<httplib::Client> client_;
    std::chrono::milliseconds chunk_timeout_{kDefaultStreamChunkTimeout};
    size_t max_queued_chunks_{kDefaultStreamQueueChunks};

    mutable std::mutex mutex_;
    std::condition_variable data_cv_;
    std::condition_variable space_cv_;
    std::deque<std::string> queue_;
    bool done_{false};
    bool stopped_{false};
    int status_{0};
    size_t bytes_received_{0};
    HubError error_;
    std::thread receiver_;
};

}  // namespace hubcache
