#include "synapse_client.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* FOLDER_TYPE = "org.sagebionetworks.repo.model.Folder";
constexpr const char* FILE_ENTITY_TYPE = "org.sagebionetworks.repo.model.FileEntity";
constexpr const char* MULTIPART_REQUEST_TYPE = "org.sagebionetworks.repo.model.file.MultipartUploadRequest";
constexpr const char* BATCH_URL_REQUEST_TYPE = "org.sagebionetworks.repo.model.file.BatchPresignedUploadUrlRequest";

Json::Value parse_json(const std::string& text) {
    Json::Value root;
    if (text.empty()) return root;

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        throw RemoteError("Malformed response: " + errs);
    }
    return root;
}

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

DigestCtx new_md5_ctx() {
    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw RemoteError("MD5 digest unavailable");
    }
    return ctx;
}

std::string finish_md5(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw RemoteError("MD5 digest failed");
    }
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

std::string read_range(const fs::path& path, uintmax_t offset, size_t length) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw RemoteError(fmt::format("Cannot open {}", path.string()));
    }
    in.seekg(static_cast<std::streamoff>(offset));
    std::string data(length, '\0');
    in.read(&data[0], static_cast<std::streamsize>(length));
    if (static_cast<size_t>(in.gcount()) != length) {
        throw RemoteError(fmt::format("Short read from {}", path.string()));
    }
    return data;
}

} // namespace

// ── Helpers ─────────────────────────────────────────────────

std::string json_to_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parse_response(const HttpResponse& response, const std::string& what) {
    if (!response.error.empty()) {
        throw RemoteError(fmt::format("{} failed: {}", what, response.error));
    }
    if (response.status < 200 || response.status >= 300) {
        std::string reason = response.body;
        try {
            Json::Value err = parse_json(response.body);
            if (err.isObject() && err.isMember("reason")) reason = err["reason"].asString();
        } catch (const RemoteError&) {
            // not JSON; keep the raw body
        }
        throw RemoteError(fmt::format("{} failed: HTTP {}: {}", what, response.status, reason),
                          static_cast<int>(response.status));
    }
    return parse_json(response.body);
}

int64_t date_to_epoch_ms(const Date& date) {
    // Days from civil (proleptic Gregorian)
    int y = date.year - (date.month <= 2 ? 1 : 0);
    int era = (y >= 0 ? y : y - 399) / 400;
    unsigned yoe = static_cast<unsigned>(y - era * 400);
    unsigned mp = static_cast<unsigned>(date.month + (date.month > 2 ? -3 : 9));
    unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(date.day) - 1;
    unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    int64_t days = static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
    return days * 86400 * 1000;
}

Json::Value annotations_to_json(const Annotations& annotations) {
    Json::Value out(Json::objectValue);
    for (const auto& [key, value] : annotations) {
        Json::Value entry;
        Json::Value values(Json::arrayValue);
        if (auto s = std::get_if<std::string>(&value)) {
            entry["type"] = "STRING";
            values.append(*s);
        } else if (auto i = std::get_if<int64_t>(&value)) {
            entry["type"] = "LONG";
            values.append(std::to_string(*i));
        } else {
            entry["type"] = "TIMESTAMP_MS";
            values.append(std::to_string(date_to_epoch_ms(std::get<Date>(value))));
        }
        entry["value"] = values;
        out[key] = entry;
    }
    return out;
}

std::string md5_hex(const std::string& data) {
    auto ctx = new_md5_ctx();
    EVP_DigestUpdate(ctx.get(), data.data(), data.size());
    return finish_md5(ctx.get());
}

std::string md5_hex_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw RemoteError(fmt::format("Cannot open {}", path.string()));
    }
    auto ctx = new_md5_ctx();
    std::vector<char> buf(1 << 16);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n > 0) EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n));
    }
    if (in.bad()) {
        throw RemoteError(fmt::format("Error reading {}", path.string()));
    }
    return finish_md5(ctx.get());
}

size_t multipart_part_size(uintmax_t file_size) {
    uintmax_t needed = (file_size + MULTIPART_MAX_PARTS - 1) / MULTIPART_MAX_PARTS;
    return static_cast<size_t>(std::max<uintmax_t>(MULTIPART_MIN_PART_BYTES, needed));
}

// ── SynapseService ──────────────────────────────────────────

SynapseService::SynapseService(EndpointConfig endpoints) : endpoints_(std::move(endpoints)) {}

std::unique_ptr<RemoteSession> SynapseService::authenticate(const std::string& username,
                                                            const std::string& password) {
    HttpClient http;
    Json::Value body;
    body["username"] = username;
    body["password"] = password;

    auto resp = http.request(HttpMethod::Post, endpoints_.auth + "/login2", json_to_string(body),
                             {"Content-Type: application/json", "Accept: application/json"});
    Json::Value result = parse_response(resp, "Login");

    std::string token = result.get("accessToken", "").asString();
    if (token.empty()) {
        throw RemoteError("Login failed: no access token in response");
    }
    log_debug(fmt::format("Logged in as {}", username));
    return std::make_unique<SynapseSession>(endpoints_, token);
}

// ── SynapseSession ──────────────────────────────────────────

SynapseSession::SynapseSession(EndpointConfig endpoints, std::string access_token)
    : endpoints_(std::move(endpoints)), auth_header_("Authorization: Bearer " + access_token) {}

Json::Value SynapseSession::call(HttpMethod method, const std::string& url,
                                 const Json::Value* body) {
    std::vector<std::string> headers = {auth_header_, "Accept: application/json"};
    std::string payload;
    if (body) {
        headers.emplace_back("Content-Type: application/json");
        payload = json_to_string(*body);
    }
    auto resp = http_.request(method, url, payload, headers);
    return parse_response(resp, fmt::format("{} {}", http_method_name(method), url));
}

EntityHandle SynapseSession::get_project(const std::string& project_id) {
    Json::Value entity = call(HttpMethod::Get, endpoints_.repo + "/entity/" + url_encode(project_id));
    return EntityHandle{entity["name"].asString(), entity["id"].asString()};
}

EntityHandle SynapseSession::create_folder(const std::string& name, const EntityHandle& parent) {
    Json::Value folder;
    folder["concreteType"] = FOLDER_TYPE;
    folder["name"] = name;
    folder["parentId"] = parent.id;

    try {
        Json::Value created = call(HttpMethod::Post, endpoints_.repo + "/entity", &folder);
        return EntityHandle{created["name"].asString(), created["id"].asString()};
    } catch (const RemoteError& e) {
        if (!e.is_conflict()) throw;
    }

    std::string id = find_child(name, parent.id);
    log_debug(fmt::format("Folder {} already exists under {} as {}", name, parent.id, id));
    return EntityHandle{name, id};
}

EntityHandle SynapseSession::store_file(const fs::path& path, const EntityHandle& parent,
                                        const Annotations& annotations,
                                        const StoreOptions& options) {
    std::string name = path.filename().string();
    std::string handle_id = upload_file_handle(path);

    Json::Value entity;
    entity["concreteType"] = FILE_ENTITY_TYPE;
    entity["name"] = name;
    entity["parentId"] = parent.id;
    entity["dataFileHandleId"] = handle_id;

    std::string id;
    try {
        Json::Value created = call(HttpMethod::Post, endpoints_.repo + "/entity", &entity);
        id = created["id"].asString();
    } catch (const RemoteError& e) {
        if (!e.is_conflict()) throw;

        id = find_child(name, parent.id);
        Json::Value existing = call(HttpMethod::Get, endpoints_.repo + "/entity/" + id);
        existing["dataFileHandleId"] = handle_id;
        std::string url = fmt::format("{}/entity/{}?newVersion={}", endpoints_.repo, id,
                                      options.force_version ? "true" : "false");
        call(HttpMethod::Put, url, &existing);
        log_debug(fmt::format("Updated existing file entity {} ({})", name, id));
    }

    if (!annotations.empty()) {
        set_annotations(id, annotations);
    }
    return EntityHandle{name, id};
}

std::string SynapseSession::find_child(const std::string& name, const std::string& parent_id) {
    Json::Value query;
    query["parentId"] = parent_id;
    query["entityName"] = name;
    Json::Value found = call(HttpMethod::Post, endpoints_.repo + "/entity/child", &query);
    std::string id = found.get("id", "").asString();
    if (id.empty()) {
        throw RemoteError(fmt::format("No child named {} under {}", name, parent_id));
    }
    return id;
}

std::string SynapseSession::upload_file_handle(const fs::path& path) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw RemoteError(fmt::format("Cannot stat {}: {}", path.string(), ec.message()));
    }
    size_t part_size = multipart_part_size(size);

    Json::Value req;
    req["concreteType"] = MULTIPART_REQUEST_TYPE;
    req["contentMD5Hex"] = md5_hex_file(path);
    req["fileName"] = path.filename().string();
    req["fileSizeBytes"] = Json::Value::UInt64(size);
    req["partSizeBytes"] = Json::Value::UInt64(part_size);
    req["contentType"] = "application/octet-stream";
    req["generatePreview"] = false;

    const std::string base = endpoints_.file + "/file/multipart";
    Json::Value status = call(HttpMethod::Post, base, &req);

    if (status["state"].asString() != "COMPLETED") {
        std::string upload_id = status["uploadId"].asString();
        std::string parts = status["partsState"].asString();
        for (size_t i = 0; i < parts.size(); ++i) {
            if (parts[i] == '1') continue;
            upload_part(upload_id, path, static_cast<int>(i + 1), part_size, size);
        }
        status = call(HttpMethod::Put, fmt::format("{}/{}/complete", base, upload_id));
        if (status["state"].asString() != "COMPLETED") {
            throw RemoteError(fmt::format("Upload of {} did not complete: {}", path.string(),
                                          status.get("errorMessage", "").asString()));
        }
    }
    return status["resultFileHandleId"].asString();
}

void SynapseSession::upload_part(const std::string& upload_id, const fs::path& path,
                                 int part_number, size_t part_size, uintmax_t file_size) {
    const std::string base = fmt::format("{}/file/multipart/{}", endpoints_.file, upload_id);

    Json::Value batch;
    batch["concreteType"] = BATCH_URL_REQUEST_TYPE;
    batch["uploadId"] = upload_id;
    batch["partNumbers"].append(part_number);
    Json::Value urls = call(HttpMethod::Post, base + "/presigned/url/batch", &batch);

    const Json::Value& presigned = urls["partPresignedUrls"][0];
    std::string url = presigned["uploadPresignedUrl"].asString();
    if (url.empty()) {
        throw RemoteError(fmt::format("No upload URL for part {} of {}", part_number, path.string()));
    }

    std::vector<std::string> headers;
    const Json::Value& signed_headers = presigned["signedHeaders"];
    for (const auto& key : signed_headers.getMemberNames()) {
        headers.push_back(key + ": " + signed_headers[key].asString());
    }

    uintmax_t offset = static_cast<uintmax_t>(part_number - 1) * part_size;
    size_t length = static_cast<size_t>(std::min<uintmax_t>(part_size, file_size - offset));
    std::string chunk = read_range(path, offset, length);

    auto resp = http_.request(HttpMethod::Put, url, chunk, headers);
    parse_response(resp, fmt::format("Part {} of {}", part_number, path.string()));

    Json::Value added = call(HttpMethod::Put, fmt::format("{}/add/{}?partMD5Hex={}",
                                                          base, part_number, md5_hex(chunk)));
    if (added["addPartState"].asString() != "ADD_SUCCESS") {
        throw RemoteError(fmt::format("Part {} of {} rejected: {}", part_number, path.string(),
                                      added.get("errorMessage", "").asString()));
    }
}

void SynapseSession::set_annotations(const std::string& entity_id, const Annotations& annotations) {
    const std::string url = fmt::format("{}/entity/{}/annotations2", endpoints_.repo, entity_id);
    Json::Value current = call(HttpMethod::Get, url);

    Json::Value body;
    body["id"] = entity_id;
    body["etag"] = current["etag"];
    body["annotations"] = annotations_to_json(annotations);
    call(HttpMethod::Put, url, &body);
}
