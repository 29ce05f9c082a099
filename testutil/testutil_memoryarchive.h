#ifndef TESTUTIL_MEMORYARCHIVE
#define TESTUTIL_MEMORYARCHIVE

#include <replica/replica_archive.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

//============================================================================
//               In-Memory Archive with Fault Injection
//============================================================================

namespace testutil {

class MemoryArchive : public replica::Archive
{
public:
    MemoryArchive()
        : replica::Archive()
        , failLoad(false)
        , failSave(false)
        , failRemove(false)
        , d_records()
        , d_payloads()
        , d_mutex()
    {
    }

    virtual bool list(const std::string &prefix, std::vector<replica::FileRecord> *records)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        for (Records::const_iterator iter = d_records.begin(); iter != d_records.end(); ++iter) {
            if (iter->second.getPath().compare(0, prefix.size(), prefix) == 0) {
                records->push_back(iter->second);
            }
        }
        return true;
    }

    virtual bool findById(const replica::Uuid &id, replica::FileRecord *record)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        Records::const_iterator iter = d_records.find(id);
        if (iter == d_records.end()) {
            return false;
        }
        *record = iter->second;
        return true;
    }

    virtual bool findByPath(const std::string &path, replica::FileRecord *record)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        for (Records::const_iterator iter = d_records.begin(); iter != d_records.end(); ++iter) {
            if (iter->second.getPath() == path) {
                *record = iter->second;
                return true;
            }
        }
        return false;
    }

    virtual bool load(const replica::Uuid &id, std::string *payload)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        std::map<replica::Uuid, std::string>::const_iterator iter = d_payloads.find(id);
        if (failLoad || iter == d_payloads.end()) {
            return false;
        }
        *payload = iter->second;
        return true;
    }

    virtual bool save(const replica::FileRecord &record, const std::string &payload)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        if (failSave) {
            return false;
        }
        for (Records::iterator iter = d_records.begin(); iter != d_records.end(); ++iter) {
            if (iter->second.getPath() == record.getPath() && iter->first != record.getID()) {
                d_payloads.erase(iter->first);
                d_records.erase(iter);
                break;
            }
        }
        replica::FileRecord stored = record;
        stored.setDeleted(false);
        d_records[record.getID()] = stored;
        d_payloads[record.getID()] = payload;
        return true;
    }

    virtual bool remove(const replica::FileRecord &record)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        Records::iterator iter = d_records.find(record.getID());
        if (failRemove || iter == d_records.end()) {
            return false;
        }
        iter->second.setDeleted(true);
        iter->second.setModified(record.getModified());
        d_payloads.erase(record.getID());
        return true;
    }

    virtual bool purge(const replica::Uuid &id)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        if (d_records.erase(id) == 0) {
            return false;
        }
        d_payloads.erase(id);
        return true;
    }

    // Store a live file directly, bypassing the fault flags.
    replica::FileRecord put(const std::string &path, replica::Timestamp modified, const std::string &payload,
                            const replica::Uuid &owner = replica::Uuid())
    {
        replica::FileRecord record(replica::Uuid::generate(), path, modified, false);
        record.setOwner(owner);
        std::lock_guard<std::mutex> lock(d_mutex);
        d_records[record.getID()] = record;
        d_payloads[record.getID()] = payload;
        return record;
    }

    // Store a tombstone directly.
    void putTombstone(const replica::FileRecord &record)
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        replica::FileRecord tombstone = record;
        tombstone.setDeleted(true);
        d_records[record.getID()] = tombstone;
        d_payloads.erase(record.getID());
    }

    int size()
    {
        std::lock_guard<std::mutex> lock(d_mutex);
        return static_cast<int>(d_records.size());
    }

    bool failLoad;
    bool failSave;
    bool failRemove;

private:
    typedef std::map<replica::Uuid, replica::FileRecord> Records;

    Records d_records;
    std::map<replica::Uuid, std::string> d_payloads;
    std::mutex d_mutex;
};

// Hands out the archives registered under their names.
class MemoryArchiveProvider : public replica::ArchiveProvider
{
public:
    void add(const std::string &name, replica::Archive *archive)
    {
        d_archives[name] = archive;
    }

    virtual replica::Archive *open(const std::string &name)
    {
        std::map<std::string, replica::Archive*>::const_iterator iter = d_archives.find(name);
        return iter == d_archives.end() ? 0 : iter->second;
    }

private:
    std::map<std::string, replica::Archive*> d_archives;
};

} // namespace testutil

#endif // TESTUTIL_MEMORYARCHIVE
