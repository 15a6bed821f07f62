#pragma once

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>

#include <iterator>
#include <memory>
#include <string>
#include "object_backend.hpp"

namespace notesync {
namespace storage {

/**
 * @brief Scoped Aws::InitAPI / Aws::ShutdownAPI.
 * Must outlive every S3Backend.
 */
class AwsApi {
private:
    Aws::SDKOptions options;

public:
    AwsApi() {
        options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
        Aws::InitAPI(options);
    }

    ~AwsApi() {
        Aws::ShutdownAPI(options);
    }

    AwsApi(const AwsApi&) = delete;
    AwsApi& operator=(const AwsApi&) = delete;
};

struct S3Options {
    std::string region = "us-west-2";
    std::string endpoint_url;  // Empty: AWS. Otherwise an S3 compatible service, path-style addressing.
    long max_retries = 3;      // Transport-level retries, handled by the SDK
};

/**
 * @brief ObjectBackend over Amazon S3 (AWS SDK for C++).
 */
class S3Backend : public ObjectBackend {
private:
    std::shared_ptr<Aws::S3::S3Client> s3;

    static Aws::String toAws(const std::string& s) {
        return Aws::String(s.c_str(), s.size());
    }

    static std::string fromAws(const Aws::String& s) {
        return std::string(s.c_str(), s.size());
    }

    /**
     * @brief "No such key" becomes NotFound. HEAD responses carry no error
     * body, so a bare 404 counts as well.
     */
    static core::Status translate(const Aws::S3::S3Error& err, const char* op, const ObjectKey& key) {
        if (err.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
            err.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
            return core::Status::NotFound("no such key " + key.toString());
        }
        return core::Status::TransportError(std::string(op) + " " + key.toString() + ": " +
                                            fromAws(err.GetExceptionName()) + " " + fromAws(err.GetMessage()));
    }

    template <typename Result>
    static void fillHead(const Result& result, ObjectHead& out_head) {
        out_head.metadata.clear();
        for (const auto& [name, value] : result.GetMetadata()) {
            out_head.metadata[fromAws(name)] = fromAws(value);
        }
        out_head.content_length = static_cast<uint64_t>(result.GetContentLength());
        out_head.content_type = fromAws(result.GetContentType());
    }

public:
    explicit S3Backend(const S3Options& options) {
        Aws::Client::ClientConfiguration config;
        config.region = toAws(options.region);
        config.retryStrategy = std::make_shared<Aws::Client::DefaultRetryStrategy>(options.max_retries);

        bool virtual_addressing = true;
        if (!options.endpoint_url.empty()) {
            config.endpointOverride = toAws(options.endpoint_url);
            if (options.endpoint_url.rfind("http://", 0) == 0) {
                config.scheme = Aws::Http::Scheme::HTTP;
            }
            virtual_addressing = false;
        }

        s3 = std::make_shared<Aws::S3::S3Client>(
            config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, virtual_addressing);
    }

    core::Status headObject(const ObjectKey& key, ObjectHead& out_head) override {
        Aws::S3::Model::HeadObjectRequest request;
        request.SetBucket(toAws(key.bucket));
        request.SetKey(toAws(key.key));

        auto outcome = s3->HeadObject(request);
        if (!outcome.IsSuccess()) {
            return translate(outcome.GetError(), "HeadObject", key);
        }

        fillHead(outcome.GetResult(), out_head);
        return core::Status::OK();
    }

    core::Status getObject(const ObjectKey& key, ObjectHead& out_head, std::string& out_content) override {
        Aws::S3::Model::GetObjectRequest request;
        request.SetBucket(toAws(key.bucket));
        request.SetKey(toAws(key.key));

        auto outcome = s3->GetObject(request);
        if (!outcome.IsSuccess()) {
            return translate(outcome.GetError(), "GetObject", key);
        }

        auto& result = outcome.GetResult();
        fillHead(result, out_head);

        auto& body = result.GetBody();
        std::string content((std::istreambuf_iterator<char>(body)), std::istreambuf_iterator<char>());
        if (body.bad()) {
            return core::Status::TransportError("GetObject " + key.toString() + ": error reading body");
        }
        out_content = std::move(content);
        return core::Status::OK();
    }

    core::Status putObject(const ObjectKey& key, const ObjectHead& head, const std::string& content) override {
        Aws::S3::Model::PutObjectRequest request;
        request.SetBucket(toAws(key.bucket));
        request.SetKey(toAws(key.key));
        request.SetContentType(toAws(head.content_type));
        request.SetContentLength(static_cast<long long>(head.content_length));

        Aws::Map<Aws::String, Aws::String> metadata;
        for (const auto& [name, value] : head.metadata) {
            metadata[toAws(name)] = toAws(value);
        }
        request.SetMetadata(metadata);

        auto body = Aws::MakeShared<Aws::StringStream>("notesync");
        body->write(content.data(), static_cast<std::streamsize>(content.size()));
        request.SetBody(body);

        auto outcome = s3->PutObject(request);
        if (!outcome.IsSuccess()) {
            return translate(outcome.GetError(), "PutObject", key);
        }
        return core::Status::OK();
    }
};

} // namespace storage
} // namespace notesync
