#include "sandbox/classifier.h"
#include "utils/utils.h"

namespace codemend {
namespace sandbox {

namespace {

bool containsAny(const std::string& line, const std::vector<std::string>& signatures) {
    for (const auto& sig : signatures) {
        if (!sig.empty() && line.find(sig) != std::string::npos) return true;
    }
    return false;
}

}

std::vector<std::string> ErrorClassifier::defaultErrorSignatures() {
    return {
        "Error:",
        "Exception:",
        "Traceback",
        "ModuleNotFoundError",
        "ImportError",
        "SyntaxError",
        "NameError",
        "TypeError",
        "ValueError"
    };
}

std::vector<std::string> ErrorClassifier::defaultWarningSignatures() {
    return {"Warning:", "warning:"};
}

ErrorClassifier::ErrorClassifier()
    : errorSignatures_(defaultErrorSignatures()),
      warningSignatures_(defaultWarningSignatures()) {}

ErrorClassifier::ErrorClassifier(std::vector<std::string> errorSignatures,
                                 std::vector<std::string> warningSignatures)
    : errorSignatures_(std::move(errorSignatures)),
      warningSignatures_(std::move(warningSignatures)) {}

Classification ErrorClassifier::classify(const std::string& stderrText) const {
    Classification out;
    for (const auto& raw : utils::Formatter::splitLines(stderrText)) {
        std::string line = utils::Formatter::trim(raw);
        if (line.empty()) continue;
        if (containsAny(line, errorSignatures_)) {
            out.errors.push_back(line);
        } else if (containsAny(line, warningSignatures_)) {
            out.warnings.push_back(line);
        }
    }
    return out;
}

}
}
