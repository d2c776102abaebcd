// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Class bigint manages the non-negative arbitrary-precision integers
 *   we use for rule numbers.  A totalistic rule over k colors and a
 *   window of n cells needs k*n-k+1 base-k digits, and a binary rule of
 *   radius 2 already needs 32 bits, so ordinary machine words do not
 *   cut it.
 *
 *   The value is held as a vector of 31-bit words, least significant
 *   word first:
 *
 *      value = sum 0<=i<w.size() 2^(31*i)*w[i]
 *
 *   We always keep a single canonical representation: the most
 *   significant word is never zero, so zero is the empty vector.  This
 *   keeps comparison simple.
 *
 *   We use a binary form (the radix is 2^31) because that makes
 *   bit extraction fast, at the expense of decimal conversion.
 *   But decimal conversion is not *that* onerous, and it only happens
 *   when parsing or printing a rule string.
 *
 *   Only the operations rule numbering needs are provided (addition,
 *   comparison, small-int multiply/divide/modulus, bit and digit
 *   extraction, radix conversion, parsing, to double, to int).
 *   Negative values are not representable; constructing from a
 *   negative int gives zero.
 */
#ifndef BIGINT_H
#define BIGINT_H
#include <vector>
#include <string>

#ifndef CALICO_INT64
#define CALICO_INT64          long long
#define CALICO_MAKEINT64(x)   x ## LL
#endif

class bigint {
public:
   bigint() {}
   bigint(int i) ;
   bigint(CALICO_INT64 i) ;
   // lenient parse: digits are accumulated, everything else is skipped,
   // so "1,234" reads as 1234; use parse() for strict checking
   bigint(const char *s) ;
   bigint& operator+=(const bigint &a) ;
   int operator==(const bigint &b) const ;
   int operator!=(const bigint &b) const ;
   int operator<=(const bigint &b) const ;
   int operator>=(const bigint &b) const ;
   int operator<(const bigint &b) const ;
   int operator>(const bigint &b) const ;
   int iszero() const { return w.empty() ; }
   int even() const ;
   int odd() const ;
   // return bit i (0 is least significant)
   int bit(int i) const ;
   // return base-b digit i (0 is least significant); b is 2..36
   int digit(int i, int b) const ;
   // note: a should be a small positive int, say 1..2^30
   void mul_smallint(int a) ;
   // note: a should be a small positive int, say 1..2^30
   void add_smallint(int a) ;
   // note: a should be a small positive int, say 1..2^30
   void div_smallint(int a) ;
   // note: a should be a small positive int, say 1..2^30
   int mod_smallint(int a) const ;
   const char *tostring(char sep=sepchar) const ;
   // digits in base b (2..36), most significant first, lowercase letters
   // above 9; zero-padded on the left to at least mindigits
   const char *tobase(int b, int mindigits=1) const ;
   double todouble() const ;
   int toint() const ;
   // how many bits required to represent this?
   int bitsreq() const ;
   // strict parse of an unsigned decimal numeral; returns error or 0
   static const char *parse(const char *s, bigint &result) ;
   // b^e for small b
   static bigint power(int b, int e) ;
   // static values predefined
   static const bigint zero, one ;
private:
   void trim() ;
   std::vector<int> w ;
   static std::string printbuf ;
   static char sepchar ;
   static int sepcount ;
} ;
#endif
