// This file is part of Calico.
// See docs/License.html for the copyright notice.

#ifndef WRITETABLE_H
#define WRITETABLE_H
#include "ruletable.h"

typedef enum {
   no_compression,      // write uncompressed data
   gzip_compression     // write gzip compressed data
} output_compression ;

/*
 *   Save a rule table in the format readruletable() reads.  Only the
 *   defined entries are written, one transition per line, with no
 *   symmetries or variables.  The window of the table must match the
 *   given neighborhood kind and radius.  Returns err msg or 0.
 */
const char *writeruletable(const char *filename, const ruletable &table,
                           TNeighborhood kind, int r,
                           output_compression compression) ;

#endif
