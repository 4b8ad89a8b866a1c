#pragma once

#include "tablepod/core/model/Session.h"

#include <functional>
#include <string>
#include <vector>

namespace tablepod::core::persist {

class ISessionStore {
public:
    virtual ~ISessionStore() = default;
    virtual bool Save(const model::Session& session, std::string* error) = 0;
    // Sessions that fail to decode are skipped and reported through error.
    virtual std::vector<model::Session> LoadAll(std::string* error) = 0;
};

// One "<CODE>.json" document per session under a directory.
class JsonFileSessionStore : public ISessionStore {
public:
    explicit JsonFileSessionStore(std::string directory,
                                  std::function<void(const std::string&)> log_fn = {});

    bool Save(const model::Session& session, std::string* error) override;
    std::vector<model::Session> LoadAll(std::string* error) override;

    std::string PathFor(const std::string& code) const;
    const std::string& directory() const { return directory_; }

private:
    void Log(const std::string& message) const;

    std::string directory_;
    std::function<void(const std::string&)> log_fn_;
};

}  // namespace tablepod::core::persist
