#ifndef BAMIO_H
#define BAMIO_H

/**
 * Methods to support the input of SAM/BAM files and the scoring of
 * aligned reads against positions of interest.
 */
#include "bamio/AlignmentRecord.hpp"
#include "bamio/AlignmentReader.hpp"
#include "bamio/CigarWalker.hpp"
#include "bamio/LinkageScanner.hpp"
#include "bamio/LinkageWriter.hpp"
#include "bamio/ReadScorer.hpp"

#endif /* BAMIO_H */
