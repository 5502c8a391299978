#include "rpl/network/record.hpp"

namespace rpl::network {

using json = nlohmann::json;

json MappingRecord::to_json() const {
    return {
        {"letter", letter.str()},
        {"remote_root", remote_root},
        {"original_path", original_path},
        {"mapped_path", mapped_path},
        {"created_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                           created_at.time_since_epoch()).count()}
    };
}

MappingRecord MappingRecord::from_json(const json& j) {
    MappingRecord record{DriveLetter(j.at("letter").get<std::string>())};
    record.remote_root = j.at("remote_root").get<std::string>();
    record.original_path = j.value("original_path", "");
    record.mapped_path = j.at("mapped_path").get<std::string>();
    record.created_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.at("created_at").get<std::int64_t>()));
    return record;
}

} // namespace rpl::network
