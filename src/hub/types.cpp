#include "hub/types.hpp"

namespace hl::hub {

bool isValidRepoType(const std::string& repoType) {
    return repoType == "model" || repoType == "dataset" || repoType == "space";
}

std::string repoUrlPrefix(const std::string& repoType) {
    if (repoType == "dataset") return "datasets/";
    if (repoType == "space") return "spaces/";
    return "";
}

}
