#include "rpl/snapshot/record.hpp"

namespace rpl::snapshot {

using json = nlohmann::json;

json SnapshotRecord::to_json() const {
    return {
        {"shadow_id", shadow_id.str()},
        {"source_volume", source_volume},
        {"snapshot_path", snapshot_path},
        {"created_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                           created_at.time_since_epoch()).count()},
        {"is_remote", is_remote},
        {"server", server},
        {"junction_path", junction_path ? json(*junction_path) : json(nullptr)},
        {"original_root", original_root},
        {"access_root", access_root}
    };
}

SnapshotRecord SnapshotRecord::from_json(const json& j) {
    SnapshotRecord record{ShadowId(j.at("shadow_id").get<std::string>())};
    record.source_volume = j.at("source_volume").get<std::string>();
    record.snapshot_path = j.at("snapshot_path").get<std::string>();
    record.created_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.at("created_at").get<std::int64_t>()));
    record.is_remote = j.at("is_remote").get<bool>();
    record.server = j.value("server", "");
    if (j.contains("junction_path") && j.at("junction_path").is_string()) {
        record.junction_path = j.at("junction_path").get<std::string>();
    }
    record.original_root = j.value("original_root", "");
    record.access_root = j.value("access_root", "");
    return record;
}

} // namespace rpl::snapshot
