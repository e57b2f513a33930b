#pragma once

#include <string>
#include <vector>

namespace codemend {
namespace sandbox {

struct Classification {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// Line-oriented scan of captured stderr. A line matching any error signature
// is an error; otherwise a line matching a warning signature is a warning;
// anything else is ignored. Output preserves input order and lines are trimmed.
class ErrorClassifier {
public:
    ErrorClassifier();
    ErrorClassifier(std::vector<std::string> errorSignatures,
                    std::vector<std::string> warningSignatures);

    Classification classify(const std::string& stderrText) const;

    const std::vector<std::string>& errorSignatures() const { return errorSignatures_; }
    const std::vector<std::string>& warningSignatures() const { return warningSignatures_; }

    static std::vector<std::string> defaultErrorSignatures();
    static std::vector<std::string> defaultWarningSignatures();

private:
    std::vector<std::string> errorSignatures_;
    std::vector<std::string> warningSignatures_;
};

}
}
