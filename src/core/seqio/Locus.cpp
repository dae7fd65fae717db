#include "Locus.hpp"

using namespace std;

namespace seqio {

Locus::Locus() : start(0), end(0) {}
Locus::Locus(string id, TCoord start, TCoord end)
: id_ref(id), start(start), end(end) {}
Locus::~Locus() {}

TCoord Locus::length() const {
  return (end > start ? end - start : 0);
}

bool Locus::overlaps(const Locus& other) const {
  return id_ref == other.id_ref && start < other.end && other.start < end;
}

TRegion Locus::region() const {
  return make_tuple(id_ref, start, end);
}

} // namespace seqio
