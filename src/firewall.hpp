#pragma once
#include <set>
#include <string>
#include <vector>

// Capability used by the response handler to cut off a source.
// Ids are source hashes without the "iphash:" prefix.
class Firewall {
public:
    virtual ~Firewall() = default;
    virtual bool block(const std::string &id, const std::string &reason) = 0;
    virtual bool unblock(const std::string &id) = 0;
    virtual std::vector<std::string> list() const = 0;
};

// Keeps the block list in memory and logs every change.
class RecordingFirewall : public Firewall {
public:
    bool block(const std::string &id, const std::string &reason) override;
    bool unblock(const std::string &id) override;
    std::vector<std::string> list() const override;

private:
    std::set<std::string> blocked;
};
