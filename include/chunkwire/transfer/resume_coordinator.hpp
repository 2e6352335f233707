#pragma once

#include "chunkwire/core/result.hpp"
#include "chunkwire/network/protocol.hpp"
#include "chunkwire/storage/bitfield.hpp"
#include "chunkwire/storage/file_metadata.hpp"
#include "chunkwire/storage/persistent_store.hpp"
#include <memory>
#include <string>

namespace chunkwire::transfer {

enum class ReconcileOutcome {
    FRESH,            // no record existed, an empty one was created
    RESUMED,          // a matching record was loaded
    MISMATCH,         // the record disagrees with the offered metadata
    STORE_FAILURE
};

const char* to_string(ReconcileOutcome outcome);

struct ReconcileResult {
    ReconcileOutcome outcome = ReconcileOutcome::FRESH;
    storage::FileRecord record;
    bool repaired = false;    // received_count or bitfield length was corrected
    std::string message;
};

// Brings a receiver's durable state in line with an offered file before any chunk moves,
// and builds/validates the BITFIELD exchanged when a transport reopens.
class ResumeCoordinator {
public:
    ResumeCoordinator(std::shared_ptr<storage::PersistentStore> store, storage::StoreRetryPolicy policy = {});

    // Loads the record for metadata.file_id or creates an empty one. A loaded record
    // has its received_count re-derived by popcount and its bitfield zero-extended
    // if it covers fewer chunks than the metadata; repairs are written back.
    ReconcileResult reconcile(const storage::FileMetadata& metadata);

    static network::BitfieldMessage make_bitfield(const storage::FileMetadata& metadata,
                                                  const storage::Bitfield& bitfield);

    // METADATA_MISMATCH when the peer describes another file or another chunk count,
    // PROTOCOL_ERROR when the bits are malformed.
    static core::Result read_peer_bitfield(const network::BitfieldMessage& message,
                                           const storage::FileMetadata& metadata,
                                           storage::Bitfield& bitfield);

private:
    std::shared_ptr<storage::PersistentStore> store_;
    storage::StoreRetryPolicy policy_;
};

}
