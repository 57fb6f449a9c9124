#include "runtime/state_codec.h"

namespace palisade {
namespace runtime {

const FieldDescriptor *
LayoutDescriptor::field(const std::string &field_name) const {
  for (const auto &f : fields) {
    if (f.name == field_name) {
      return &f;
    }
  }
  return nullptr;
}

bool is_contiguous(const LayoutDescriptor &layout) {
  size_t expected_offset = 0;
  for (const auto &f : layout.fields) {
    if (f.size == 0 || f.offset != expected_offset) {
      return false;
    }
    expected_offset += f.size;
  }
  return expected_offset == layout.len;
}

} // namespace runtime
} // namespace palisade
