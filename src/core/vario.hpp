#ifndef VARIO_H
#define VARIO_H

/** Positions of interest, their alleles and per-read allele calls. */
#include "vario/PositionOfInterest.hpp"
#include "vario/PositionTable.hpp"
#include "vario/AlleleClassifier.hpp"

#endif /* VARIO_H */
