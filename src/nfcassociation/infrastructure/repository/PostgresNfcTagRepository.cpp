/**
 * @file PostgresNfcTagRepository.cpp
 * @brief PostgresNfcTagRepository implementation
 */

#include "nfcassociation/infrastructure/repository/PostgresNfcTagRepository.hpp"
#include "shared/exception/Exceptions.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <chrono>

namespace nfcassociation::infrastructure::repository {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

constexpr const char* SELECT_COLUMNS =
    "SELECT uid, associated_playlist_id, last_detected_at, detection_count, "
    "metadata::text AS metadata, created_at, version FROM nfc_tag";

std::string toEpochMillis(TimePoint tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    return std::to_string(ms.count());
}

TimePoint fromEpochMillis(const Json::Value& value) {
    return TimePoint(std::chrono::milliseconds(value.asInt64()));
}

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
        spdlog::warn("[PostgresNfcTagRepository] Ignoring unreadable metadata: {}", errors);
        return Json::Value(Json::objectValue);
    }
    return value;
}

} // anonymous namespace

PostgresNfcTagRepository::PostgresNfcTagRepository(std::shared_ptr<persistence::IQueryExecutor> executor)
    : executor_(std::move(executor)) {
    if (!executor_) {
        throw std::invalid_argument("PostgresNfcTagRepository: executor cannot be nullptr");
    }
    spdlog::debug("[PostgresNfcTagRepository] Initialized");
}

void PostgresNfcTagRepository::ensureSchema() {
    executor_->executeCommand(
        "CREATE TABLE IF NOT EXISTS nfc_tag ("
        "  uid VARCHAR(64) PRIMARY KEY,"
        "  associated_playlist_id VARCHAR(255),"
        "  last_detected_at BIGINT,"
        "  detection_count INTEGER NOT NULL DEFAULT 0,"
        "  metadata JSONB NOT NULL DEFAULT '{}'::jsonb,"
        "  created_at BIGINT NOT NULL,"
        "  version INTEGER NOT NULL DEFAULT 0"
        ")", {});
    executor_->executeCommand(
        "CREATE INDEX IF NOT EXISTS idx_nfc_tag_playlist ON nfc_tag (associated_playlist_id)", {});
    spdlog::info("[PostgresNfcTagRepository] Schema ready");
}

std::optional<NfcTag> PostgresNfcTagRepository::findByIdentifier(const TagIdentifier& identifier) {
    Json::Value rows = executor_->executeQuery(
        std::string(SELECT_COLUMNS) + " WHERE uid = $1", {identifier.getUid()});
    if (rows.empty()) {
        return std::nullopt;
    }
    return mapRowToTag(rows[0]);
}

void PostgresNfcTagRepository::save(const NfcTag& tag) {
    std::vector<std::string> params = {
        tag.getIdentifier().getUid(),
        tag.getAssociatedPlaylistId().value_or(""),
        tag.getLastDetectedAt() ? toEpochMillis(*tag.getLastDetectedAt()) : "",
        std::to_string(tag.getDetectionCount()),
        writeJson(tag.getMetadata()),
        toEpochMillis(tag.getCreatedAt()),
        std::to_string(tag.getVersion())
    };

    int affected = executor_->executeCommand(
        "INSERT INTO nfc_tag (uid, associated_playlist_id, last_detected_at, detection_count, "
        "metadata, created_at, version) VALUES ($1, $2, $3, $4, $5::jsonb, $6, $7) "
        "ON CONFLICT (uid) DO UPDATE SET "
        "associated_playlist_id = EXCLUDED.associated_playlist_id, "
        "last_detected_at = EXCLUDED.last_detected_at, "
        "detection_count = EXCLUDED.detection_count, "
        "metadata = EXCLUDED.metadata, "
        "version = EXCLUDED.version "
        "WHERE nfc_tag.version < EXCLUDED.version",
        params);
    if (affected == 0) {
        spdlog::debug("[PostgresNfcTagRepository] Tag {} not written, stored version is not older than {}",
                     tag.getIdentifier().getUid(), tag.getVersion());
    }
}

std::vector<NfcTag> PostgresNfcTagRepository::findByPlaylistId(const std::string& playlistId) {
    Json::Value rows = executor_->executeQuery(
        std::string(SELECT_COLUMNS) + " WHERE associated_playlist_id = $1 ORDER BY uid", {playlistId});

    std::vector<NfcTag> tags;
    for (const auto& row : rows) {
        tags.push_back(mapRowToTag(row));
    }
    return tags;
}

std::vector<NfcTag> PostgresNfcTagRepository::findAll() {
    Json::Value rows = executor_->executeQuery(std::string(SELECT_COLUMNS) + " ORDER BY uid");

    std::vector<NfcTag> tags;
    for (const auto& row : rows) {
        tags.push_back(mapRowToTag(row));
    }
    return tags;
}

bool PostgresNfcTagRepository::deleteByIdentifier(const TagIdentifier& identifier) {
    return executor_->executeCommand("DELETE FROM nfc_tag WHERE uid = $1", {identifier.getUid()}) > 0;
}

int PostgresNfcTagRepository::count() {
    Json::Value rows = executor_->executeQuery("SELECT COUNT(*)::int AS total FROM nfc_tag");
    return rows.empty() ? 0 : rows[0]["total"].asInt();
}

NfcTag PostgresNfcTagRepository::mapRowToTag(const Json::Value& row) {
    std::optional<std::string> playlistId;
    if (!row["associated_playlist_id"].isNull()) {
        playlistId = row["associated_playlist_id"].asString();
    }

    std::optional<TimePoint> lastDetectedAt;
    if (!row["last_detected_at"].isNull()) {
        lastDetectedAt = fromEpochMillis(row["last_detected_at"]);
    }

    Json::Value metadata(Json::objectValue);
    if (!row["metadata"].isNull()) {
        metadata = parseJson(row["metadata"].asString());
    }

    return NfcTag::reconstruct(
        TagIdentifier::of(row["uid"].asString()),
        std::move(playlistId),
        lastDetectedAt,
        row["detection_count"].asInt(),
        std::move(metadata),
        fromEpochMillis(row["created_at"]),
        row["version"].asInt()
    );
}

} // namespace nfcassociation::infrastructure::repository
