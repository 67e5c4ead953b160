#include "download/download_stream.h"

#include <spdlog/spdlog.h>

namespace hubcache {

DownloadStream::DownloadStream(std::unique_ptr<httplib::Client> client,
                               std::string path,
                               httplib::Headers headers,
                               std::chrono::milliseconds chunk_timeout,
                               size_t max_queued_chunks)
    : client_(std::move(client)),
      chunk_timeout_(chunk_timeout),
      max_queued_chunks_(max_queued_chunks == 0 ? 1 : max_queued_chunks) {
    receiver_ = std::thread(&DownloadStream::run, this, std::move(path), std::move(headers));
}

DownloadStream::DownloadStream(HubError error) : error_(std::move(error)) {
    done_ = true;
}

DownloadStream::~DownloadStream() {
    stop(HubError::make(HubErrorCode::kCancelled, "stream destroyed"));
}

void DownloadStream::run(std::string path, httplib::Headers headers) {
    {
        // stopped before the request went out; client_->stop() has no socket to close yet
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            done_ = true;
            data_cv_.notify_all();
            return;
        }
    }
    auto res = client_->Get(
        path,
        headers,
        [this](const httplib::Response& r) {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = r.status;
            if (r.status < 200 || r.status >= 300) {
                error_ = HubError::fromStatus(r.status);
                return false;
            }
            return !stopped_;
        },
        [this](const char* data, size_t len) {
            std::unique_lock<std::mutex> lock(mutex_);
            space_cv_.wait(lock, [this] { return stopped_ || queue_.size() < max_queued_chunks_; });
            if (stopped_) return false;
            queue_.emplace_back(data, len);
            bytes_received_ += len;
            data_cv_.notify_one();
            return true;
        });

    std::lock_guard<std::mutex> lock(mutex_);
    if (!res && error_.ok() && !stopped_) {
        error_ = HubError::make(HubErrorCode::kConnectionFailed,
                                "stream failed: " + httplib::to_string(res.error()));
    }
    done_ = true;
    data_cv_.notify_all();
}

bool DownloadStream::next(std::string& chunk) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = data_cv_.wait_for(lock, chunk_timeout_, [this] {
        return !queue_.empty() || done_ || stopped_;
    });
    if (!ready) {
        lock.unlock();
        spdlog::warn("DownloadStream: no chunk within {} ms", chunk_timeout_.count());
        stop(HubError::make(HubErrorCode::kTimeout, "no chunk received within timeout"));
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    chunk = std::move(queue_.front());
    queue_.pop_front();
    space_cv_.notify_one();
    return true;
}

void DownloadStream::cancel() {
    stop(HubError::make(HubErrorCode::kCancelled, "stream cancelled"));
}

void DownloadStream::stop(HubError reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopped_) {
            stopped_ = true;
            // a finished stream keeps its own outcome
            if (!done_ && error_.ok()) {
                error_ = std::move(reason);
            }
            queue_.clear();
        }
    }
    space_cv_.notify_all();
    data_cv_.notify_all();
    if (client_) {
        client_->stop();
    }
    if (receiver_.joinable() && receiver_.get_id() != std::this_thread::get_id()) {
        receiver_.join();
    }
}

HubError DownloadStream::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

int DownloadStream::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

size_t DownloadStream::bytesReceived() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_received_;
}

}  // namespace hubcache
