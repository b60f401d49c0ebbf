#pragma once

#include <string>
#include <vector>

// Outcome of one export run
class ExportResult {
public:
    enum Status { Saved, NotSaved };

    ExportResult();

    static ExportResult saved(const std::vector<std::string> &files);
    static ExportResult notSaved(const std::string &reason);

    Status getStatus() const { return status; }
    bool isSaved() const { return status == Saved; }
    const std::string &getReason() const { return reason; }
    const std::vector<std::string> &getFiles() const { return files; }
    std::string toString() const;

private:
    Status status;
    std::string reason;
    std::vector<std::string> files;
};
