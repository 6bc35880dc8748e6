#include "model/replica.h"
#include "model/json_fields.h"
#include "utils/utils.h"

#include <sstream>

namespace avatarcli {
namespace model {

Replica Replica::fromJson(const nlohmann::json& j) {
    Replica r;
    r.replicaId = stringField(j, "replica_id");
    r.replicaName = stringField(j, "replica_name");
    r.replicaType = stringField(j, "replica_type");
    r.status = stringField(j, "status");
    r.trainingProgress = stringField(j, "training_progress");
    r.createdAt = stringField(j, "created_at");
    r.updatedAt = stringField(j, "updated_at");
    r.thumbnailVideoUrl = stringField(j, "thumbnail_video_url");
    return r;
}

int Replica::trainingPercentage() const {
    auto parts = utils::Formatter::split(trainingProgress, '/');
    if (parts.size() != 2) return 0;
    try {
        size_t used = 0;
        long long current = std::stoll(parts[0], &used);
        if (used != parts[0].size()) return 0;
        long long total = std::stoll(parts[1], &used);
        if (used != parts[1].size() || total == 0) return 0;
        return static_cast<int>(current * 100 / total);
    } catch (const std::exception&) {
        return 0;
    }
}

std::string Replica::shortLabel() const {
    const char* mark = isCompleted() ? "[ok]" : isTraining() ? "[..]" : "[x]";
    std::ostringstream out;
    out << mark << " " << replicaName << " (" << replicaId << ") - " << status
        << " - " << trainingProgress;
    return out.str();
}

std::string Replica::longLabel() const {
    std::ostringstream out;
    out << "Replica Details:\n";
    out << "  ID: " << replicaId << "\n";
    out << "  Name: " << replicaName << "\n";
    out << "  Type: " << replicaType << "\n";
    out << "  Status: " << status << "\n";
    out << "  Training Progress: " << trainingProgress << "\n";
    out << "  Created: " << createdAt << "\n";
    if (!thumbnailVideoUrl.empty()) {
        out << "  Thumbnail URL: " << thumbnailVideoUrl << "\n";
    }
    if (auto created = utils::Formatter::formatIsoTimestamp(createdAt)) {
        out << "  Created Date: " << *created << "\n";
    }
    if (auto updated = utils::Formatter::formatIsoTimestamp(updatedAt)) {
        out << "  Updated Date: " << *updated << "\n";
    }
    out << "  Training Percentage: " << trainingPercentage() << "%";
    return out.str();
}

}
}
