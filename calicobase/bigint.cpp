// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "bigint.h"
#include <limits.h>
#include <algorithm>
using namespace std ;
/**
 *   Static data.
 */
static const int WORDBITS = 31 ;
static const int WORDMASK = 0x7fffffff ;
string bigint::printbuf ;
char bigint::sepchar = ',' ;
int bigint::sepcount = 3 ;
static const char *digitchars = "0123456789abcdefghijklmnopqrstuvwxyz" ;
/**
 *   Routines.
 */
bigint::bigint(int i) {
   if (i > 0)
      w.push_back(i & WORDMASK) ;
}
bigint::bigint(CALICO_INT64 i) {
   while (i > 0) {
      w.push_back((int)(i & WORDMASK)) ;
      i >>= WORDBITS ;
   }
}
bigint::bigint(const char *s) {
   while (*s) {
      if (*s >= '0' && *s <= '9') {
         mul_smallint(10) ;
         add_smallint(*s - '0') ;
      }
      s++ ;
   }
}
/**
 *   Drop high zero words so the representation stays canonical.
 */
void bigint::trim() {
   while (!w.empty() && w.back() == 0)
      w.pop_back() ;
}
bigint& bigint::operator+=(const bigint &a) {
   if (a.w.size() > w.size())
      w.resize(a.w.size(), 0) ;
   int carry = 0 ;
   for (unsigned int i=0; i<w.size(); i++) {
      // both addends are 31-bit so the sum fits in an unsigned int
      unsigned int u = (unsigned int)w[i] + (unsigned int)carry ;
      if (i < a.w.size())
         u += (unsigned int)a.w[i] ;
      w[i] = (int)(u & WORDMASK) ;
      carry = (int)(u >> WORDBITS) ;
   }
   if (carry)
      w.push_back(carry) ;
   return *this ;
}
int bigint::operator==(const bigint &b) const {
   return w == b.w ;
}
int bigint::operator!=(const bigint &b) const {
   return !(*this == b) ;
}
int bigint::operator<(const bigint &b) const {
   if (w.size() != b.w.size())
      return w.size() < b.w.size() ;
   for (int i=(int)w.size()-1; i>=0; i--)
      if (w[i] != b.w[i])
         return w[i] < b.w[i] ;
   return 0 ;
}
int bigint::operator<=(const bigint &b) const {
   return !(b < *this) ;
}
int bigint::operator>(const bigint &b) const {
   return b < *this ;
}
int bigint::operator>=(const bigint &b) const {
   return !(*this < b) ;
}
int bigint::even() const {
   return w.empty() || (w[0] & 1) == 0 ;
}
int bigint::odd() const {
   return !even() ;
}
int bigint::bit(int i) const {
   if (i < 0)
      return 0 ;
   unsigned int word = i / WORDBITS ;
   if (word >= w.size())
      return 0 ;
   return (w[word] >> (i % WORDBITS)) & 1 ;
}
int bigint::digit(int i, int b) const {
   if (i < 0)
      return 0 ;
   if (b == 2)
      return bit(i) ;
   bigint t = *this ;
   while (i-- > 0 && !t.iszero())
      t.div_smallint(b) ;
   return t.mod_smallint(b) ;
}
void bigint::mul_smallint(int a) {
   if (a == 0) {
      w.clear() ;
      return ;
   }
   CALICO_INT64 carry = 0 ;
   for (unsigned int i=0; i<w.size(); i++) {
      CALICO_INT64 t = (CALICO_INT64)w[i] * a + carry ;
      w[i] = (int)(t & WORDMASK) ;
      carry = t >> WORDBITS ;
   }
   while (carry) {
      w.push_back((int)(carry & WORDMASK)) ;
      carry >>= WORDBITS ;
   }
}
void bigint::add_smallint(int a) {
   CALICO_INT64 carry = a ;
   for (unsigned int i=0; carry && i<w.size(); i++) {
      CALICO_INT64 t = (CALICO_INT64)w[i] + carry ;
      w[i] = (int)(t & WORDMASK) ;
      carry = t >> WORDBITS ;
   }
   while (carry) {
      w.push_back((int)(carry & WORDMASK)) ;
      carry >>= WORDBITS ;
   }
}
void bigint::div_smallint(int a) {
   CALICO_INT64 rem = 0 ;
   for (int i=(int)w.size()-1; i>=0; i--) {
      CALICO_INT64 t = (rem << WORDBITS) | w[i] ;
      w[i] = (int)(t / a) ;
      rem = t % a ;
   }
   trim() ;
}
int bigint::mod_smallint(int a) const {
   CALICO_INT64 rem = 0 ;
   for (int i=(int)w.size()-1; i>=0; i--)
      rem = ((rem << WORDBITS) | w[i]) % a ;
   return (int)rem ;
}
const char *bigint::tostring(char sep) const {
   printbuf.clear() ;
   bigint t = *this ;
   int n = 0 ;
   do {
      if (sep && n > 0 && n % sepcount == 0)
         printbuf += sep ;
      printbuf += (char)('0' + t.mod_smallint(10)) ;
      t.div_smallint(10) ;
      n++ ;
   } while (!t.iszero()) ;
   reverse(printbuf.begin(), printbuf.end()) ;
   return printbuf.c_str() ;
}
const char *bigint::tobase(int b, int mindigits) const {
   printbuf.clear() ;
   if (b < 2 || b > 36)
      return printbuf.c_str() ;
   bigint t = *this ;
   do {
      printbuf += digitchars[t.mod_smallint(b)] ;
      t.div_smallint(b) ;
   } while (!t.iszero()) ;
   while ((int)printbuf.size() < mindigits)
      printbuf += '0' ;
   reverse(printbuf.begin(), printbuf.end()) ;
   return printbuf.c_str() ;
}
double bigint::todouble() const {
   double r = 0 ;
   for (int i=(int)w.size()-1; i>=0; i--)
      r = r * 2147483648.0 + w[i] ;
   return r ;
}
/**
 *   Values that do not fit are clamped to INT_MAX.
 */
int bigint::toint() const {
   if (w.empty())
      return 0 ;
   if (w.size() > 1)
      return INT_MAX ;
   return w[0] ;
}
int bigint::bitsreq() const {
   if (w.empty())
      return 0 ;
   int r = WORDBITS * ((int)w.size() - 1) ;
   int top = w.back() ;
   while (top) {
      r++ ;
      top >>= 1 ;
   }
   return r ;
}
const char *bigint::parse(const char *s, bigint &result) {
   result = zero ;
   if (s == 0 || *s == 0)
      return "Missing rule number." ;
   while (*s) {
      if (*s < '0' || *s > '9')
         return "Rule number must be an unsigned decimal integer." ;
      result.mul_smallint(10) ;
      result.add_smallint(*s - '0') ;
      s++ ;
   }
   return 0 ;
}
bigint bigint::power(int b, int e) {
   bigint r(1) ;
   for (int i=0; i<e; i++)
      r.mul_smallint(b) ;
   return r ;
}
const bigint bigint::zero(0) ;
const bigint bigint::one(1) ;
