#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <json/json.h>
#include <core/config.hpp>
#include <core/types.hpp>
#include "http_client.hpp"
#include "remote_service.hpp"

// Synapse REST implementation of the remote service.
//
// Authentication exchanges username/password for a bearer token
// (auth/login2). Files go through the multipart upload protocol
// (file/multipart) and are then attached to a FileEntity under the parent.
class SynapseService : public RemoteService {
public:
    explicit SynapseService(EndpointConfig endpoints);

    std::unique_ptr<RemoteSession> authenticate(const std::string& username,
                                                const std::string& password) override;

private:
    EndpointConfig endpoints_;
};

class SynapseSession : public RemoteSession {
public:
    SynapseSession(EndpointConfig endpoints, std::string access_token);

    EntityHandle get_project(const std::string& project_id) override;
    EntityHandle create_folder(const std::string& name, const EntityHandle& parent) override;
    EntityHandle store_file(const std::filesystem::path& path, const EntityHandle& parent,
                            const Annotations& annotations, const StoreOptions& options) override;

private:
    Json::Value call(HttpMethod method, const std::string& url,
                     const Json::Value* body = nullptr);
    std::string find_child(const std::string& name, const std::string& parent_id);
    std::string upload_file_handle(const std::filesystem::path& path);
    void upload_part(const std::string& upload_id, const std::filesystem::path& path,
                     int part_number, size_t part_size, uintmax_t file_size);
    void set_annotations(const std::string& entity_id, const Annotations& annotations);

    EndpointConfig endpoints_;
    std::string auth_header_;
    HttpClient http_;
};

// ── Helpers (exposed for tests) ─────────────────────────────

// Throws RemoteError with the service's "reason" text for non-2xx responses.
Json::Value parse_response(const HttpResponse& response, const std::string& what);

// annotations2 body: {"key": {"type": "STRING"|"LONG"|"TIMESTAMP_MS", "value": [..]}}
Json::Value annotations_to_json(const Annotations& annotations);

// Milliseconds since the epoch at UTC midnight of the date.
int64_t date_to_epoch_ms(const Date& date);

std::string md5_hex(const std::string& data);

// Throws RemoteError if the file cannot be read.
std::string md5_hex_file(const std::filesystem::path& path);

// Part size for a file: at least the service minimum, and large enough that
// the file fits in the maximum number of parts.
size_t multipart_part_size(uintmax_t file_size);

std::string json_to_string(const Json::Value& value);
