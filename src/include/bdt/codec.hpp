#pragma once

#include <bdt/document_reader.hpp>
#include <bdt/document_writer.hpp>
#include <bdt/wire_type.hpp>

#include <memory>

namespace bdt {

  // Converts values of T to and from wire primitives. Implementations are
  // immutable and may be shared between threads.
  template <typename T>
  class codec {
  public:
    using value_type = T;

    virtual ~codec() = default;

    virtual void
    serialize(document_writer& writer, const T& value) const = 0;

    virtual T
    deserialize(document_reader& reader) const = 0;
  };

  // Returns `current` itself when it already uses `representation`,
  // otherwise a new shared codec with that representation and the rest of
  // its configuration unchanged.
  template <typename Codec>
  std::shared_ptr<const Codec>
  with_representation(const std::shared_ptr<const Codec>& current,
                      wire_type representation) {
    if (current->representation() == representation) { return current; }
    return std::make_shared<const Codec>(
        current->with_representation(representation));
  }

} // namespace bdt
