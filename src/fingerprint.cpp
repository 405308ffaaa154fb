// ═══════════════════════════════════════════════════════════════════
//  src/fingerprint.cpp — Request fingerprinting
// ═══════════════════════════════════════════════════════════════════

#include "pqcache/fingerprint.h"
#include "pqcache/crypto.h"
#include "pqcache/error.h"

namespace pqcache {

std::string canonicalVariables(const std::optional<nlohmann::json>& variables) {
    if (!variables.has_value() || !variables->is_object()) {
        return "";
    }

    try {
        return variables->dump();
    } catch (const nlohmann::json::type_error& e) {
        throw SerializationError(std::string("Variables could not be serialized: ") + e.what());
    }
}

std::string fingerprint(const std::string& persistHash,
                        const std::optional<nlohmann::json>& variables) {
    return crypto::sha256(persistHash + canonicalVariables(variables));
}

} // namespace pqcache
