#include "ExportResult.hpp"

ExportResult::ExportResult()
    : status(NotSaved), reason("not run"), files() {}

ExportResult ExportResult::saved(const std::vector<std::string> &files) {
    ExportResult result;
    result.status = Saved;
    result.reason.clear();
    result.files = files;
    return result;
}

ExportResult ExportResult::notSaved(const std::string &reason) {
    ExportResult result;
    result.status = NotSaved;
    result.reason = reason;
    return result;
}

std::string ExportResult::toString() const {
    if (status == Saved) {
        return "FBX file saved (" + std::to_string(files.size()) + " file" + (files.size() == 1 ? "" : "s") + ")";
    }
    return "File not saved: " + reason;
}
