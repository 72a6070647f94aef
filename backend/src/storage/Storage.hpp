#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../core/Ladder.hpp"
#include "../core/Topic.hpp"

// Storage turns the topic collection into bytes on disk and back.
//
// Plain layout (text):
//   Header: "FMNSTORE1\n"
//   Records: one "key=value" line per field, "---" after each record.
//   Values escape '\\', '\n' and '\r'. Timestamps are ISO-8601 UTC.
//
// Sealed layout (when a passphrase is set):
//   Header: 9 bytes ASCII "FMNSEAL1\n"
//   Salt: crypto_pwhash_SALTBYTES
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: crypto_secretbox_easy of the plain layout
//
// Every failure here is a PersistenceError. Records that break invariants
// are repaired, records that cannot be repaired are skipped; both are logged.

class Storage {
public:
    // TOPICS (text)
    static std::string serializeTopics(const std::vector<Topic>& topics);
    static std::vector<Topic> parseTopics(const std::string& plain, const Ladder& ladder);

    // SEALING (libsodium)
    static std::string seal(const std::string& plain, const std::string& passphrase);
    static std::string unseal(const std::string& sealed, const std::string& passphrase);
    static bool isSealed(const std::string& data);

    // FILES
    // nullopt when the file does not exist
    static std::optional<std::string> readFile(const std::string& filename);
    // temp file + fsync + rename; the target is either old or new, never partial
    static void writeFileAtomic(const std::string& filename, const std::string& data);

    // Whole store: read/unseal/parse and serialize/seal/write
    static std::vector<Topic> loadTopics(const std::string& filename, const Ladder& ladder, const std::string& passphrase);
    static void saveTopics(const std::vector<Topic>& topics, const std::string& filename, const std::string& passphrase);
};
