#include "store/s3_object_store.hpp"
#include "store/s3_utils.hpp"

#include <aws/core/http/HttpResponse.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3ClientConfiguration.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace S3Fs::Store
{

StoreErrc S3ErrorToStoreErrc(const Aws::S3::S3Error& error)
{
    switch (error.GetErrorType()) {
        case Aws::S3::S3Errors::NO_SUCH_KEY:
            return StoreErrc::NoSuchKey;
        case Aws::S3::S3Errors::NO_SUCH_BUCKET:
            return StoreErrc::NoSuchBucket;
        case Aws::S3::S3Errors::ACCESS_DENIED:
        case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
        case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
        case Aws::S3::S3Errors::MISSING_AUTHENTICATION_TOKEN:
        case Aws::S3::S3Errors::UNRECOGNIZED_CLIENT:
            return StoreErrc::AccessDenied;
        case Aws::S3::S3Errors::NETWORK_CONNECTION:
            return StoreErrc::NetworkFailure;
        default:
            break;
    }

    if (error.GetExceptionName() == "InvalidRange" ||
        error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUESTED_RANGE_NOT_SATISFIABLE) {
        return StoreErrc::InvalidRange;
    }
    if (error.GetErrorType() == Aws::S3::S3Errors::RESOURCE_NOT_FOUND ||
        error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
        return StoreErrc::NoSuchKey;
    }
    return StoreErrc::RequestFailed;
}

std::chrono::system_clock::time_point ToTimePoint(const Aws::Utils::DateTime& date_time)
{
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(date_time.Millis()));
}

//------------------------------------------------------------------------------//
// S3ObjectBody
//------------------------------------------------------------------------------//

S3ObjectBody::S3ObjectBody(Aws::S3::Model::GetObjectResult&& result)
    : result_(std::make_unique<Aws::S3::Model::GetObjectResult>(std::move(result)))
{
}

StoreResult<std::size_t> S3ObjectBody::Read(std::span<std::byte> buffer)
{
    if (!result_) {
        return std::unexpected(make_error_code(StoreErrc::StreamError));
    }
    if (buffer.empty()) {
        return 0;
    }

    auto& stream = result_->GetBody();
    stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (stream.bad()) {
        spdlog::error("S3ObjectBody::Read: body stream entered a bad state");
        return std::unexpected(make_error_code(StoreErrc::StreamError));
    }
    return static_cast<std::size_t>(stream.gcount());
}

StoreResult<void> S3ObjectBody::Close()
{
    if (!result_) {
        return std::unexpected(make_error_code(StoreErrc::StreamError));
    }
    result_.reset();
    return {};
}

//------------------------------------------------------------------------------//
// S3ObjectStore
//------------------------------------------------------------------------------//

S3ObjectStore::S3ObjectStore(const Config::StoreDefinition& definition) : definition_(definition)
{
    if (definition_.bucket.empty()) {
        throw std::invalid_argument("S3ObjectStore requires a non-empty bucket.");
    }

    Aws::S3::S3ClientConfiguration config;
    config.region               = definition_.region;
    config.useVirtualAddressing = !definition_.path_style;
    if (definition_.endpoint.has_value()) {
        config.endpointOverride = *definition_.endpoint;
    }

    client_ = std::make_unique<Aws::S3::S3Client>(config);
    spdlog::debug(
        "S3ObjectStore created for bucket '{}' in region '{}'", definition_.bucket,
        definition_.region
    );
}

S3ObjectStore::~S3ObjectStore() = default;

const std::string& S3ObjectStore::GetBucket() const { return definition_.bucket; }

StoreResult<ObjectResponse> S3ObjectStore::GetObject(
    const std::string& key, const std::optional<ByteRange>& range
)
{
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(definition_.bucket);
    request.SetKey(key);
    if (range.has_value()) {
        request.SetRange(range->ToHeader());
    }

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        spdlog::warn(
            "S3ObjectStore::GetObject failed for '{}/{}': {} ({})", definition_.bucket, key,
            error.GetMessage().c_str(), error.GetExceptionName().c_str()
        );
        return std::unexpected(make_error_code(S3ErrorToStoreErrc(error)));
    }

    Aws::S3::Model::GetObjectResult result(outcome.GetResultWithOwnership());

    ObjectResponse response;
    response.metadata.content_length = result.GetContentLength();
    response.metadata.last_modified  = ToTimePoint(result.GetLastModified());
    spdlog::trace(
        "S3ObjectStore::GetObject '{}/{}': {} bytes", definition_.bucket, key,
        response.metadata.content_length
    );
    response.body = std::make_unique<S3ObjectBody>(std::move(result));
    return response;
}

StoreResult<ObjectMetadata> S3ObjectStore::HeadObject(const std::string& key)
{
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(definition_.bucket);
    request.SetKey(key);

    auto outcome = client_->HeadObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        spdlog::trace(
            "S3ObjectStore::HeadObject failed for '{}/{}': {} ({})", definition_.bucket, key,
            error.GetMessage().c_str(), error.GetExceptionName().c_str()
        );
        return std::unexpected(make_error_code(S3ErrorToStoreErrc(error)));
    }

    const auto& result = outcome.GetResult();
    ObjectMetadata metadata;
    metadata.content_length = result.GetContentLength();
    metadata.last_modified  = ToTimePoint(result.GetLastModified());
    return metadata;
}

}  // namespace S3Fs::Store
