#ifndef SEQIO_H
#define SEQIO_H

/** Genomic coordinates and positions-of-interest input. */
#include "seqio/types.hpp"
#include "seqio/Locus.hpp"
#include "seqio/BedFile.hpp"

#endif /* SEQIO_H */
