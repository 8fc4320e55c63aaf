#include "upload/model/Job.hpp"

namespace hl::upload {

std::string to_string(const StageKind kind) {
    switch (kind) {
        case StageKind::Hash: return "hash";
        case StageKind::Classify: return "get_upload_mode";
        case StageKind::Preupload: return "preupload_lfs";
        case StageKind::Commit: return "commit";
        case StageKind::Wait: return "wait";
        case StageKind::Exit: return "exit";
    }
    return "unknown";
}

}
