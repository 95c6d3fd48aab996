#ifndef S3FS_TESTS_FAKE_OBJECT_STORE_HPP_
#define S3FS_TESTS_FAKE_OBJECT_STORE_HPP_

#include "store/i_object_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace S3Fs::Testing
{

// Body over an in-memory copy, optionally failing once `fail_after` bytes were delivered
class MemoryObjectBody : public Store::IObjectBody
{
    public:
    MemoryObjectBody(std::string data, std::optional<std::size_t> fail_after, int* close_counter)
        : data_(std::move(data)), fail_after_(fail_after), close_counter_(close_counter)
    {
    }

    Store::StoreResult<std::size_t> Read(std::span<std::byte> buffer) override
    {
        if (closed_) {
            return std::unexpected(make_error_code(Store::StoreErrc::StreamError));
        }
        if (fail_after_.has_value() && pos_ >= *fail_after_) {
            return std::unexpected(make_error_code(Store::StoreErrc::NetworkFailure));
        }

        std::size_t limit = data_.size();
        if (fail_after_.has_value()) {
            limit = std::min(limit, *fail_after_);
        }
        // Hand out at most 7 bytes per call so callers must loop
        std::size_t n = std::min({buffer.size(), limit - pos_, std::size_t{7}});
        std::memcpy(buffer.data(), data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    Store::StoreResult<void> Close() override
    {
        if (closed_) {
            return std::unexpected(make_error_code(Store::StoreErrc::StreamError));
        }
        closed_ = true;
        if (close_counter_) {
            ++*close_counter_;
        }
        return {};
    }

    private:
    std::string data_;
    std::size_t pos_ = 0;
    std::optional<std::size_t> fail_after_;
    int* close_counter_;
    bool closed_ = false;
};

class FakeObjectStore : public Store::IObjectStore
{
    public:
    struct Object {
        std::string data;
        std::chrono::system_clock::time_point last_modified;
    };

    explicit FakeObjectStore(std::string bucket = "test-bucket") : bucket_(std::move(bucket)) {}

    void Put(
        const std::string& key, std::string data,
        std::chrono::system_clock::time_point last_modified = std::chrono::system_clock::time_point(
            std::chrono::seconds(1431907200)
        )
    )
    {
        objects_[key] = Object{std::move(data), last_modified};
    }

    // Injected failures
    std::optional<std::error_code> get_error;
    std::optional<std::error_code> head_error;
    std::optional<std::size_t> body_fail_after;

    // Observations
    int get_calls   = 0;
    int head_calls  = 0;
    int close_calls = 0;
    std::vector<std::string> requested_keys;
    std::vector<std::optional<std::string>> requested_ranges;

    [[nodiscard]] const std::string& GetBucket() const override { return bucket_; }

    Store::StoreResult<Store::ObjectResponse> GetObject(
        const std::string& key, const std::optional<Store::ByteRange>& range
    ) override
    {
        ++get_calls;
        requested_keys.push_back(key);
        requested_ranges.push_back(
            range.has_value() ? std::optional<std::string>(range->ToHeader()) : std::nullopt
        );

        if (get_error.has_value()) {
            return std::unexpected(*get_error);
        }
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return std::unexpected(make_error_code(Store::StoreErrc::NoSuchKey));
        }

        std::string content = it->second.data;
        if (range.has_value()) {
            auto size = static_cast<std::int64_t>(content.size());
            if (range->Start() >= size) {
                return std::unexpected(make_error_code(Store::StoreErrc::InvalidRange));
            }
            auto end = std::min(range->End(), size - 1);
            content  = content.substr(
                static_cast<std::size_t>(range->Start()),
                static_cast<std::size_t>(end - range->Start() + 1)
            );
        }

        Store::ObjectResponse response;
        response.metadata.content_length = static_cast<std::int64_t>(content.size());
        response.metadata.last_modified  = it->second.last_modified;
        response.body =
            std::make_unique<MemoryObjectBody>(std::move(content), body_fail_after, &close_calls);
        return response;
    }

    Store::StoreResult<Store::ObjectMetadata> HeadObject(const std::string& key) override
    {
        ++head_calls;
        if (head_error.has_value()) {
            return std::unexpected(*head_error);
        }
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return std::unexpected(make_error_code(Store::StoreErrc::NoSuchKey));
        }
        return Store::ObjectMetadata{
            static_cast<std::int64_t>(it->second.data.size()), it->second.last_modified
        };
    }

    private:
    std::string bucket_;
    std::map<std::string, Object> objects_;
};

// Sample content of `size` bytes with a recognizable pattern
inline std::string MakeContent(std::size_t size)
{
    std::string content(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>('a' + (i % 26));
    }
    return content;
}

inline std::string ToString(const std::vector<std::byte>& bytes, std::size_t n)
{
    return std::string(reinterpret_cast<const char*>(bytes.data()), n);
}

}  // namespace S3Fs::Testing

#endif  // S3FS_TESTS_FAKE_OBJECT_STORE_HPP_
