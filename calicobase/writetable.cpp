// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "writetable.h"
#include <zlib.h>
#include <fstream>
#include <ostream>
#include <streambuf>
#include <stdio.h>
using namespace std ;

/*
 *   Output side of a gzip file as a streambuf, so the table writer can
 *   use one ostream for both kinds of output.  There is no put area;
 *   every write goes straight to zlib, which does its own buffering.
 */
class gzwritebuf : public streambuf {
public:
   gzwritebuf() : file(0) {}
   ~gzwritebuf() { close() ; }
   gzwritebuf *open(const char *path) {
      if (file)
         return 0 ;
      file = gzopen(path, "wb") ;
      return file ? this : 0 ;
   }
   // returns 0 if the file was not open or gzclose failed
   gzwritebuf *close() {
      if (!file)
         return 0 ;
      int res = gzclose(file) ;
      file = 0 ;
      return res == Z_OK ? this : 0 ;
   }
protected:
   virtual int overflow(int c) {
      if (c == EOF)
         return 0 ;
      return gzputc(file, c) ;
   }
   virtual streamsize xsputn(const char *s, streamsize n) {
      if (n <= 0)
         return 0 ;
      int written = gzwrite(file, s, (unsigned int)n) ;
      return written > 0 ? written : 0 ;
   }
   // called by ostream::flush
   virtual int sync() {
      return gzflush(file, Z_SYNC_FLUSH) == Z_OK ? 0 : -1 ;
   }
private:
   gzFile file ;
} ;

static void writetransitions(ostream &os, const ruletable &table) {
   bool commafree = table.NumCellStates() <= 10 ;
   neighborhood nb ;
   for (int i=0; i<table.numentries(); i++) {
      int out = table.get(i) ;
      if (out < 0)
         continue ;
      table.tupleat(i, nb) ;
      for (size_t j=0; j<nb.size(); j++) {
         os << (int)nb[j] ;
         if (!commafree)
            os << ',' ;
      }
      os << out << '\n' ;
   }
}

const char *writeruletable(const char *filename, const ruletable &table,
                           TNeighborhood kind, int r,
                           output_compression compression) {
   if (r < 1)
      return "Neighborhood radius must be at least 1." ;
   if (windowsize(kind, r) != table.windowsize())
      return "Rule table does not match the neighborhood." ;

   filebuf plainbuf ;
   gzwritebuf zbuf ;
   streambuf *sb = 0 ;
   switch (compression) {
   default:
      sb = plainbuf.open(filename, ios_base::out) ;
      break ;
   case gzip_compression:
      sb = zbuf.open(filename) ;
      break ;
   }
   if (!sb)
      return "Can't create rule table file!" ;

   ostream os(sb) ;
   os << "n_states:" << table.NumCellStates() << '\n' ;
   os << "neighborhood:" << neighborhoodname(kind) << '\n' ;
   os << "radius:" << r << '\n' ;
   os << "symmetries:none" << '\n' ;
   writetransitions(os, table) ;

   const char *errmsg = 0 ;
   if (!os.flush())
      errmsg = "Error occurred writing file; maybe disk is full?" ;
   if (compression == gzip_compression) {
      if (zbuf.close() == 0 && errmsg == 0)
         errmsg = "Error occurred writing file; maybe disk is full?" ;
   } else {
      if (plainbuf.close() == 0 && errmsg == 0)
         errmsg = "Error occurred writing file; maybe disk is full?" ;
   }
   return errmsg ;
}
