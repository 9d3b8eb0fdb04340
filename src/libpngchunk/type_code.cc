//
// Text conversions of chunk type codes.
//

#include <pngchunk/type_code.hh>
#include <pngchunk/exceptions.hh>

#include "utf8.hh"

namespace pngchunk {

    type_code type_code::from_text(std::string_view text) {
        THROW_INVALID_TYPE_UNLESS(text.size() == size, std::string(text),
                                  "expected ", size, " bytes, got ", text.size());

        std::array<std::uint8_t, 4> bytes{};
        std::copy_n(text.begin(), size, bytes.begin());
        type_code result(bytes);

        // Only the letter ranges are checked here, the reserved bit may be set
        THROW_INVALID_TYPE_UNLESS(result.is_alphanumeric_code(), std::string(text),
                                  "'", text, "' contains a byte that is not an ASCII letter");
        return result;
    }

    std::string type_code::to_string() const {
        if (!is_valid_utf8(m_bytes.data(), m_bytes.size())) {
            throw text_render_error(m_bytes);
        }
        return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
    }

}
