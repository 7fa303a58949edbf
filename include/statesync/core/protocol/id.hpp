#pragma once

#include <string>
#include <string_view>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>


namespace statesync::core::protocol {

// -----------------------------------------------------------------------------
// IdGenerator
// -----------------------------------------------------------------------------
//
// RFC-4122 random identifiers for message ids, plus the client instance id
// announced in the handshake ("<platform>_<8 hex>").
//
// Not thread-safe: one generator per Session, used from the poll thread.
// -----------------------------------------------------------------------------
class IdGenerator {
public:
    [[nodiscard]]
    inline std::string next() {
        return boost::uuids::to_string(gen_());
    }

    [[nodiscard]]
    inline std::string instance_id(std::string_view platform) {
        std::string uuid = next();
        std::string out(platform);
        out += '_';
        out.append(uuid, 0, 8);
        return out;
    }

private:
    boost::uuids::random_generator gen_;
};

} // namespace statesync::core::protocol
