/* minischeme.hpp Scheme-style evaluator in C++ with reference-counted cells and tail-call elimination,
   based on lisp.hpp by Robert A. van Engelen 2022 BSD-3 license
   This C++17 version encapsulates the entire interpreter in a single Scheme class */

#ifndef MINISCHEME_HPP
#define MINISCHEME_HPP

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#ifdef HAVE_SIGNAL_H
#include <signal.h>             /* to catch CTRL-C and continue the REPL */
#endif

#ifdef HAVE_READLINE_H
#include <readline/readline.h>  /* for convenient line editing ... */
#include <readline/history.h>   /* ... and a history of previous input */
#else
inline void using_history() { }
#endif

namespace minischeme {

class Scheme {

/*----------------------------------------------------------------------------*\
 |      EXPRESSION TYPES                                                      |
\*----------------------------------------------------------------------------*/

public:

typedef Scheme This;

/* a Scheme expression is a tagged cell, shared by reference:
        I      unsigned integer (32 bit unsigned)
        L      shared pointer to a cell, code and data alike
        List   the items of a list, or the arguments passed to a procedure
        E      shared pointer to an environment
   variables and function parameters are named as follows:
        x,y    any expression
        n      number
        t      list
        f      procedure or primitive
        e,d    environment
        v      the name of a variable or a list of variable names */
typedef uint32_t I;
struct Cell;
class Env;
typedef std::shared_ptr<Cell> L;
typedef std::vector<L> List;
typedef std::shared_ptr<Env> E;

/* cell tags */
static constexpr I INTG = 1, REAL = 2, ATOM = 3, LIST = 4, BOOL = 5, PRIM = 6, CLOS = 7, VOID = 8;

/* syntactic forms of expressions, a LIST caches its form after it is first classified */
static constexpr I NONE = 0, SELF = 1, SYMBOL = 2, QUOTE = 3, IF = 4, DEFINE = 5, DEFUN = 6, SET = 7, LAMBDA = 8,
                   COND = 9, OR = 10, AND = 11, BEGIN = 12, APPLY = 13, INVALID = 14;

/* the primitive ordinal of a PRIM, the value of an INTG or the value 0 or 1 of a BOOL is n,
   the name of an ATOM is s, a CLOS is the triple parameters v, body l, and its static scope e */
struct Cell {
  I t;                                          /* tag */
  I f;                                          /* syntactic form of a LIST, NONE until classified */
  int64_t n;
  double r;                                     /* value of a REAL */
  std::string s;                                /* name of an ATOM, or the name of a CLOS made by define */
  List l;                                       /* items of a LIST, or the body of a CLOS */
  std::vector<std::string> v;
  E e;
  explicit Cell(I t) : t(t), f(NONE), n(0), r(0) { }
};

/* cell(t):     returns a new cell with tag t
   integer(n):  returns a new INTG
   real(n):     returns a new REAL
   atom(s):     returns a new ATOM, atoms are compared by name and not interned
   list(t):     returns a new LIST with items t */
static L cell(I t) {
  return std::make_shared<Cell>(t);
}

static L integer(int64_t n) {
  L x = cell(INTG);
  x->n = n;
  return x;
}

static L real(double n) {
  L x = cell(REAL);
  x->r = n;
  return x;
}

static L atom(const std::string& s) {
  L x = cell(ATOM);
  x->s = s;
  return x;
}

static L list(const List& t = List()) {
  L x = cell(LIST);
  x->l = t;
  return x;
}

/* returns #t or #f */
L boolean(bool b) const {
  return b ? tru : fls;
}

/* number(x) is nonzero if x is an INTG or a REAL */
static I number(const L& x) {
  return x->t == INTG || x->t == REAL;
}

/* truthy(x) is zero if x is #f, zero or the empty list, nonzero for every other value */
static I truthy(const L& x) {
  switch (x->t) {
    case BOOL: return x->n != 0;
    case INTG: return x->n != 0;
    case REAL: return x->r != 0;
    case LIST: return !x->l.empty();
    default:   return 1;
  }
}

/*----------------------------------------------------------------------------*\
 |      ERROR HANDLING AND ERROR MESSAGES                                     |
\*----------------------------------------------------------------------------*/

public:

/* error codes */
static constexpr int ERR_LIST = 1, ERR_BREAK = 2, ERR_UNBOUND = 3, ERR_APPLY = 4, ERR_ARGS = 5,
                     ERR_SYNTAX = 6, ERR_INVOKE = 7, ERR_READ = 8, ERR_STACK = 9;

/* details of the last error thrown */
static inline char why[1024];

/* format the details of the error and throw an exception */
#define ERR(n, ...) (snprintf(why, sizeof(why), __VA_ARGS__), err(n))
static L err(int n) { throw n; }

/* return error string for error code or empty string */
static const char *error(int i) {
  switch (i) {
    case ERR_LIST:    return "not a list";
    case ERR_BREAK:   return "break";
    case ERR_UNBOUND: return "unbound symbol";
    case ERR_APPLY:   return "cannot apply";
    case ERR_ARGS:    return "arguments";
    case ERR_SYNTAX:  return "invalid syntax";
    case ERR_INVOKE:  return "evaluation";
    case ERR_READ:    return "syntax";
    case ERR_STACK:   return "stack over";
    default:          return "";
  }
}

/* thrown by input() at the quit command or at the end of input */
struct QUIT { };

#ifdef HAVE_SIGNAL_H

/* set by CTRL-C, eval() turns it into a break error */
static inline volatile sig_atomic_t brk = 0;
static void sigint(int) { brk = 1; }                             /* cannot throw in sig handlers */
static void break_on() { signal(SIGINT, This::sigint); }
static void break_default() { signal(SIGINT, SIG_DFL); }

#else

static inline volatile int brk = 0;
static void break_on() { }
static void break_default() { }

#endif

/*----------------------------------------------------------------------------*\
 |      ENVIRONMENTS                                                          |
\*----------------------------------------------------------------------------*/

public:

/* an environment is a frame of bindings chained to the enclosing environment, frames are shared by the
   environments extending them and by the closures that captured them */
class Env : public std::enable_shared_from_this<Env> {
 public:
  typedef std::map<std::string, L> Frame;

  Frame frame;
  E outer;

  explicit Env(const E& outer = E()) : outer(outer) { }
  Env(const Frame& frame, const E& outer) : frame(frame), outer(outer) { }

  /* look up the value of variable v, from the innermost to the outermost frame */
  L lookup(const std::string& v) const {
    for (const Env *d = this; d; d = d->outer.get()) {
      Frame::const_iterator i = d->frame.find(v);
      if (i != d->frame.end())
        return i->second;
    }
    return ERR(ERR_UNBOUND, "%s", v.c_str());
  }

  /* bind v to x in the innermost frame, shadowing any outer binding of v */
  void define(const std::string& v, const L& x) {
    frame[v] = x;
  }

  /* change the value of v in the frame where v is bound */
  void mutate(const std::string& v, const L& x) {
    for (Env *d = this; d; d = d->outer.get()) {
      Frame::iterator i = d->frame.find(v);
      if (i != d->frame.end()) {
        i->second = x;
        return;
      }
    }
    ERR(ERR_UNBOUND, "%s", v.c_str());
  }

  /* returns a new environment with a new innermost frame of bindings d */
  E extend(const Frame& d = Frame()) {
    return std::make_shared<Env>(d, shared_from_this());
  }
};

/* the standard global environment with the primitives */
E env;

/* a new empty top-level frame over the global environment */
E top() {
  return env->extend();
}

/*----------------------------------------------------------------------------*\
 |      CONSTRUCTION                                                          |
\*----------------------------------------------------------------------------*/

public:

/* the constants #t, #f, and the no-value sentinel returned by define, set! and display */
L tru, fls, nothing;

/* the raw expression of the last syntax or evaluation error */
L culprit;

/* the files we are reading from and writing to, stdin and stdout by default */
FILE *in, *out;

/* tr: 0 when tracing is off, 1 or 2 to trace evaluation steps
   depth: depth of traced evaluations
   level: number of nested evaluations, at most MAXLEVEL to stay within the C++ stack */
I tr, depth, level;

static constexpr I MAXLEVEL = 2000;

Scheme() {
  tru = cell(BOOL);
  tru->n = 1;
  fls = cell(BOOL);
  nothing = cell(VOID);
  in = stdin;
  out = stdout;
  tr = 0;
  depth = 0;
  level = 0;
  env = std::make_shared<Env>();
  env->define("#t", tru);
  env->define("#f", fls);
  env->define("pi", real(std::acos(-1.0)));
  env->define("e", real(std::exp(1.0)));
  for (I i = 0; prim()[i].s; ++i) {             /* expand environment with primitives */
    L f = cell(PRIM);
    f->n = i;
    env->define(prim()[i].s, f);
  }
  ptr = "";
  see = 0;
  strcpy(ps, "> ");
  break_on();                                   /* enable interrupt if compiled with -DHAVE_SIGNAL_H */
}

~Scheme() {
  break_default();                              /* reinstate CTRL-C default if compiled with -DHAVE_SIGNAL_H */
}

/* reset the evaluation state before the next top-level evaluation */
void unwind() {
  depth = 0;
  level = 0;
  brk = 0;
}

/* define the NAME=VALUE option s in environment e, returns zero when s is not of this form */
I option(const char *s, const E& e) {
  const char *p = strchr(s, '=');
  if (!p || p == s || !p[1] || strchr(p+1, '='))
    return 0;
  e->define(std::string(s, p-s), literal(p+1));
  return 1;
}

/*----------------------------------------------------------------------------*\
 |      READ                                                                  |
\*----------------------------------------------------------------------------*/

public:

/* specify the source text to parse */
void source(const char *s) {
  ptr = s;
  see = ' ';
}

/* return nonzero if the source has more expressions to read */
I more() {
  skip();
  return see != 0;
}

/* return the expression parsed and read from the source */
L read() {
  scan();
  return parse();
}

/* return the first expression parsed from string s */
L parse(const char *s) {
  source(s);
  return read();
}

/* return the integer, floating point number or symbol of token s */
static L literal(const char *s) {
  char *end;
  errno = 0;
  long long n = strtoll(s, &end, 10);
  if (end != s && !*end && errno != ERANGE)
    return integer(n);
  const char *p = s + (*s == '+' || *s == '-');
  if (p[0] == '0' && (p[1] == 'x' || p[1] == 'X'))
    return atom(s);                             /* hexadecimal tokens are symbols */
  double r = strtod(s, &end);                   /* including inf, -inf and nan */
  if (end != s && !*end)
    return real(r);
  return atom(s);
}

/* specify a REPL prompt */
void prompt(const char *s) {
  snprintf(ps, sizeof(ps), "%s", s);
}

/* read lines of input until the brackets balance, throws QUIT at the .q command or at the end of input */
void input(std::string& s) {
  int k = 0;
  s.clear();
  do {
    std::string t = line();
    size_t n = t.find_last_not_of(" \t\r");
    t.erase(n == std::string::npos ? 0 : n+1);
    if (t == ".q")
      throw QUIT();
    for (size_t i = 0; i < t.size() && t[i] && t[i] != ';'; ++i) {
      if (strchr(opening, t[i]))
        ++k;
      else if (strchr(closing, t[i]) && --k < 0)
        ERR(ERR_READ, "unexpected %c", t[i]);
    }
    s += t;
    s += '\n';
    strcpy(ps, "? ");                           /* change prompt to ? */
  } while (k > 0);
}

protected:

/* list delimiters, the i'th opening bracket is closed by the i'th closing bracket */
static constexpr const char *opening = "([{", *closing = ")]}";

/* pointer into the source text, the next character that we see, and the token buffer */
const char *ptr;
char see;
std::string buf;

/* prompt string */
char ps[20];

/* return the character we see, advance to the next character */
char get() {
  char look = see;
  see = *ptr ? *ptr++ : 0;
  return look;                                  /* return the previous character we were looking at */
}

/* return nonzero if we are looking at character c, ' ' means any white space */
I seeing(char c) {
  return c == ' ' ? see > 0 && see <= c : see == c;
}

/* skip white space and ;-comments */
void skip() {
  while (seeing(' ') || seeing(';'))
    if (get() == ';')
      while (see && !seeing('\n'))              /* skip ;-comment until newline */
        get();
}

/* tokenize into buf, return first character of buf */
char scan() {
  buf.clear();
  skip();
  if (!see)
    ERR(ERR_READ, "unexpected end of source");
  if (strchr(opening, see) || strchr(closing, see) || seeing('\''))
    buf += get();                               /* brackets and ' are single-character tokens */
  else                                          /* tokenize a symbol or a number */
    do
      buf += get();
    while (see && !seeing(' ') && !seeing(';') && !strchr(opening, see) && !strchr(closing, see));
  return buf[0];
}

/* return a parsed list closed by bracket c */
L parselist(char c) {
  L x = list();
  while (scan() != c)
    x->l.push_back(parse());
  return x;
}

/* return a parsed expression */
L parse() {
  const char *s = strchr(opening, buf[0]);
  if (s)                                        /* if token is an opening bracket then parse a list */
    return parselist(closing[s-opening]);
  if (buf[0] == '\'') {                         /* if token is ' then parse an expression x to return (quote x) */
    L x = list();
    x->l.push_back(atom("quote"));
    x->l.push_back(read());
    return x;
  }
  if (strchr(closing, buf[0]))
    return ERR(ERR_READ, "unexpected %s", buf.c_str());
  return literal(buf.c_str());
}

/* return the next line of input */
std::string line() {
  std::string s;
#ifdef HAVE_READLINE_H
  rl_instream = in;
  char *p = readline(ps);
  if (!p)
    throw QUIT();
  s = p;
  free(p);                                      /* free the line that was malloc'ed by readline */
  if (!s.empty())
    add_history(s.c_str());                     /* make it part of the history */
#else
  int c;
  printf("%s", ps);
  fflush(stdout);
  while ((c = getc(in)) != EOF && c != '\n')
    s += static_cast<char>(c);
  if (c == EOF && s.empty())
    throw QUIT();
#endif
  return s;
}

/*----------------------------------------------------------------------------*\
 |      PRIMITIVES                                                            |
\*----------------------------------------------------------------------------*/

public:

/* return the floating point value of number x */
static double num(const L& x) {
  if (x->t == INTG)
    return static_cast<double>(x->n);
  if (x->t != REAL)
    ERR(ERR_ARGS, "not a number %s", show(x).c_str());
  return x->r;
}

/* return the items of list x */
static const List& items(const L& x) {
  if (x->t != LIST)
    ERR(ERR_LIST, "%s", show(x).c_str());
  return x->l;
}

/* return an INTG of n when n fits, else a REAL */
static L integral(double n) {
  if (!std::isfinite(n))
    ERR(ERR_ARGS, "cannot convert %s to an integer", flonum(n).c_str());
  return n >= -9223372036854775808.0 && n < 9223372036854775808.0 ? integer(static_cast<int64_t>(n)) : real(n);
}

/* fold numbers t[k], t[k+1] ... into x, with integer operation g that returns true on overflow and floating
   point operation h */
template<typename G, typename H>
static L fold(const List& t, size_t k, L x, G g, H h) {
  num(x);
  for (; k < t.size(); ++k) {
    int64_t n;
    if (x->t == INTG && t[k]->t == INTG && !g(x->n, t[k]->n, &n))
      x = integer(n);
    else
      x = real(h(num(x), num(t[k])));
  }
  return x;
}

/* compare x and y with c, numbers compare by value and symbols by name */
template<typename C>
static bool compare(const L& x, const L& y, C c) {
  if (x->t == INTG && y->t == INTG)
    return c(x->n, y->n);
  if (x->t == ATOM && y->t == ATOM)
    return c(x->s, y->s);
  return c(num(x), num(y));
}

/* chained comparison of t[0], t[1] ... */
template<typename C>
L chain(const List& t, C c) {
  for (size_t k = 1; k < t.size(); ++k)
    if (!compare(t[k-1], t[k], c))
      return fls;
  return tru;
}

/* structural equality, numbers of both kinds compare by value */
static bool equal(const L& x, const L& y) {
  if (number(x) && number(y))
    return x->t == INTG && y->t == INTG ? x->n == y->n : num(x) == num(y);
  if (x->t != y->t)
    return false;
  switch (x->t) {
    case ATOM: return x->s == y->s;
    case BOOL: return x->n == y->n;
    case LIST:
      if (x->l.size() != y->l.size())
        return false;
      for (size_t i = 0; i < x->l.size(); ++i)
        if (!equal(x->l[i], y->l[i]))
          return false;
      return true;
    default:   return x == y;
  }
}

L f_add(const List& t) {
  return fold(t, 0, integer(0),
      [](int64_t a, int64_t b, int64_t *c) { return __builtin_add_overflow(a, b, c); },
      [](double a, double b) { return a + b; });
}

L f_sub(const List& t) {
  const L& x = t[0];
  if (t.size() > 1)
    return fold(t, 1, x,
        [](int64_t a, int64_t b, int64_t *c) { return __builtin_sub_overflow(a, b, c); },
        [](double a, double b) { return a - b; });
  if (x->t == INTG && x->n != INT64_MIN)
    return integer(-x->n);
  return real(-num(x));
}

L f_mul(const List& t) {
  return fold(t, 0, integer(1),
      [](int64_t a, int64_t b, int64_t *c) { return __builtin_mul_overflow(a, b, c); },
      [](double a, double b) { return a * b; });
}

L f_div(const List& t) {
  size_t k = t.size() > 1;
  double n = k ? num(t[0]) : 1.0;
  for (; k < t.size(); ++k) {
    double d = num(t[k]);
    if (d == 0)
      ERR(ERR_ARGS, "division by zero");
    n /= d;
  }
  return real(n);
}

L f_quotient(const List& t) {
  const L& x = t[0], &y = t[1];
  if (num(y) == 0)
    ERR(ERR_ARGS, "division by zero");
  if (x->t == INTG && y->t == INTG && !(x->n == INT64_MIN && y->n == -1)) {
    int64_t q = x->n / y->n;
    if (x->n % y->n && (x->n < 0) != (y->n < 0))
      --q;                                      /* round toward negative infinity */
    return integer(q);
  }
  return real(std::floor(num(x) / num(y)));
}

L f_abs(const List& t) {
  const L& x = t[0];
  if (x->t == INTG && x->n != INT64_MIN)
    return integer(x->n < 0 ? -x->n : x->n);
  return real(std::fabs(num(x)));
}

L f_round(const List& t) {
  const L& x = t[0];
  return x->t == INTG ? x : integral(std::nearbyint(num(x)));  /* rounds half to even */
}

L f_max(const List& t) {
  L x = t[0];
  num(x);
  for (size_t k = 1; k < t.size(); ++k)
    if (compare(x, t[k], std::less<>()))
      x = t[k];
  return x;
}

L f_min(const List& t) {
  L x = t[0];
  num(x);
  for (size_t k = 1; k < t.size(); ++k)
    if (compare(t[k], x, std::less<>()))
      x = t[k];
  return x;
}

L f_eq(const List& t) {
  for (size_t k = 1; k < t.size(); ++k)
    if (!equal(t[0], t[k]))
      return fls;
  return tru;
}

L f_lt(const List& t) {
  return chain(t, std::less<>());
}

L f_gt(const List& t) {
  return chain(t, std::greater<>());
}

L f_le(const List& t) {
  return chain(t, std::less_equal<>());
}

L f_ge(const List& t) {
  return chain(t, std::greater_equal<>());
}

L f_sqrt(const List& t) {
  double n = num(t[0]);
  if (n < 0)
    ERR(ERR_ARGS, "math domain error");
  return real(std::sqrt(n));
}

L f_exp(const List& t) {
  return real(std::exp(num(t[0])));
}

L f_log(const List& t) {
  double n = num(t[0]);
  if (n <= 0)
    ERR(ERR_ARGS, "math domain error");
  return real(std::log(n));
}

L f_sin(const List& t) {
  return real(std::sin(num(t[0])));
}

L f_cos(const List& t) {
  return real(std::cos(num(t[0])));
}

L f_tan(const List& t) {
  return real(std::tan(num(t[0])));
}

L f_atan(const List& t) {
  return real(std::atan(num(t[0])));
}

L f_floor(const List& t) {
  return t[0]->t == INTG ? t[0] : integral(std::floor(num(t[0])));
}

L f_ceil(const List& t) {
  return t[0]->t == INTG ? t[0] : integral(std::ceil(num(t[0])));
}

L f_pow(const List& t) {
  return real(std::pow(num(t[0]), num(t[1])));
}

L f_car(const List& t) {
  const List& s = items(t[0]);
  return s.empty() ? ERR(ERR_LIST, "car of ()") : s.front();
}

L f_cdr(const List& t) {
  const List& s = items(t[0]);
  return list(s.empty() ? List() : List(s.begin()+1, s.end()));
}

L f_cons(const List& t) {
  L x = list(List(1, t[0]));
  const List& s = items(t[1]);
  x->l.insert(x->l.end(), s.begin(), s.end());
  return x;
}

L f_list(const List& t) {
  return list(t);
}

L f_append(const List& t) {
  L x = list();
  for (size_t k = 0; k < t.size(); ++k) {
    const List& s = items(t[k]);
    x->l.insert(x->l.end(), s.begin(), s.end());
  }
  return x;
}

L f_length(const List& t) {
  return integer(static_cast<int64_t>(items(t[0]).size()));
}

L f_apply(const List& t) {
  return call(t[0], items(t[1]));
}

L f_map(const List& t) {
  L x = list();
  size_t n = items(t[1]).size();
  for (size_t k = 2; k < t.size(); ++k)         /* stop at the end of the shortest list */
    n = std::min(n, items(t[k]).size());
  for (size_t i = 0; i < n; ++i) {
    List s;
    for (size_t k = 1; k < t.size(); ++k)
      s.push_back(t[k]->l[i]);
    x->l.push_back(call(t[0], s));
  }
  return x;
}

L f_filter(const List& t) {
  L x = list();
  const List& s = items(t[1]);
  for (size_t i = 0; i < s.size(); ++i)
    if (truthy(call(t[0], List(1, s[i]))))
      x->l.push_back(s[i]);
  return x;
}

L f_identical(const List& t) {
  const L& x = t[0], &y = t[1];
  if (x == y)
    return tru;
  if (x->t != y->t)
    return fls;
  switch (x->t) {
    case INTG: return boolean(x->n == y->n);
    case REAL: return boolean(x->r == y->r);
    case ATOM: return boolean(x->s == y->s);
    case LIST: return boolean(x->l.empty() && y->l.empty());
    default:   return fls;
  }
}

L f_equal(const List& t) {
  return boolean(equal(t[0], t[1]));
}

L f_not(const List& t) {
  return boolean(!truthy(t[0]));
}

L f_nullp(const List& t) {
  return boolean(t[0]->t == LIST && t[0]->l.empty());
}

L f_listp(const List& t) {
  return boolean(t[0]->t == LIST);
}

L f_numberp(const List& t) {
  return boolean(number(t[0]));
}

L f_symbolp(const List& t) {
  return boolean(t[0]->t == ATOM);
}

L f_procedurep(const List& t) {
  return boolean(t[0]->t == PRIM || t[0]->t == CLOS);
}

L f_display(const List& t) {
  print(t[0]);
  putc('\n', out);
  return nothing;
}

L f_trace(const List& t) {
  I k = tr;
  if (!t.empty()) {
    if (t[0]->t != INTG || t[0]->n < 0)
      ERR(ERR_ARGS, "trace level %s", show(t[0]).c_str());
    tr = static_cast<I>(t[0]->n);
  }
  return integer(k);
}

protected:

/* maximum number of arguments of a variadic primitive */
static constexpr I MANY = 0xffffffff;

/* primitive with a name s, a function f, and the minimum lo and maximum hi number of arguments */
struct Prim {
  const char *s;
  std::function<L(This&,const List&)> f;
  I lo, hi;
};

/* table of primitives */
static const Prim *prim() {
  static const Prim table[] = {
    {"+",          &This::f_add,        0, MANY},  /* (+ n1 n2 ... nk) => n1+n2+...+nk */
    {"-",          &This::f_sub,        1, MANY},  /* (- n1 n2 ... nk) => n1-n2-...-nk or -n1 if k=1 */
    {"*",          &This::f_mul,        0, MANY},  /* (* n1 n2 ... nk) => n1*n2*...*nk */
    {"/",          &This::f_div,        1, MANY},  /* (/ n1 n2 ... nk) => n1/n2/.../nk or 1/n1 if k=1, floating */
    {"quotient",   &This::f_quotient,   2, 2},     /* (quotient n1 n2) => n1/n2 rounded toward -inf */
    {"abs",        &This::f_abs,        1, 1},     /* (abs n) => |n| */
    {"round",      &This::f_round,      1, 1},     /* (round n) => <integer> nearest to n, ties to even */
    {"max",        &This::f_max,        1, MANY},  /* (max n1 n2 ... nk) => largest ni */
    {"min",        &This::f_min,        1, MANY},  /* (min n1 n2 ... nk) => smallest ni */
    {"=",          &This::f_eq,         1, MANY},  /* (= x1 x2 ... xk) => #t if all xi equal x1 else #f */
    {"<",          &This::f_lt,         1, MANY},  /* (< x1 x2 ... xk) => #t if x1<x2<...<xk else #f */
    {">",          &This::f_gt,         1, MANY},  /* (> x1 x2 ... xk) => #t if x1>x2>...>xk else #f */
    {"<=",         &This::f_le,         1, MANY},  /* (<= x1 x2 ... xk) => #t if x1<=x2<=...<=xk else #f */
    {">=",         &This::f_ge,         1, MANY},  /* (>= x1 x2 ... xk) => #t if x1>=x2>=...>=xk else #f */
    {"sqrt",       &This::f_sqrt,       1, 1},
    {"exp",        &This::f_exp,        1, 1},
    {"log",        &This::f_log,        1, 1},
    {"sin",        &This::f_sin,        1, 1},
    {"cos",        &This::f_cos,        1, 1},
    {"tan",        &This::f_tan,        1, 1},
    {"atan",       &This::f_atan,       1, 1},
    {"floor",      &This::f_floor,      1, 1},     /* (floor n) => <integer> */
    {"ceil",       &This::f_ceil,       1, 1},     /* (ceil n) => <integer> */
    {"pow",        &This::f_pow,        2, 2},     /* (pow n1 n2) => n1^n2, floating */
    {"car",        &This::f_car,        1, 1},     /* (car <list>) => first item of <list> */
    {"cdr",        &This::f_cdr,        1, 1},     /* (cdr <list>) => <list> without its first item */
    {"cons",       &This::f_cons,       2, 2},     /* (cons x <list>) => <list> with x in front */
    {"list",       &This::f_list,       0, MANY},  /* (list x1 x2 ... xk) => (x1 x2 ... xk) */
    {"append",     &This::f_append,     0, MANY},  /* (append <list1> ... <listk>) => items of all lists */
    {"length",     &This::f_length,     1, 1},     /* (length <list>) => number of items */
    {"apply",      &This::f_apply,      2, 2},     /* (apply f <list>) => value of f applied to items of <list> */
    {"map",        &This::f_map,        2, MANY},  /* (map f <list1> ... <listk>) => list of f applied to items */
    {"filter",     &This::f_filter,     2, 2},     /* (filter f <list>) => items x for which (f x) is truthy */
    {"eq?",        &This::f_identical,  2, 2},     /* (eq? x y) => #t if x and y are identical else #f */
    {"equal?",     &This::f_equal,      2, 2},     /* (equal? x y) => #t if x and y are structurally equal else #f */
    {"not",        &This::f_not,        1, 1},     /* (not x) => #t if x is falsy else #f */
    {"null?",      &This::f_nullp,      1, 1},     /* (null? x) => #t if x is () else #f */
    {"list?",      &This::f_listp,      1, 1},
    {"number?",    &This::f_numberp,    1, 1},
    {"symbol?",    &This::f_symbolp,    1, 1},
    {"procedure?", &This::f_procedurep, 1, 1},
    {"display",    &This::f_display,    1, 1},     /* (display x) -- prints x and a newline */
    {"trace",      &This::f_trace,      0, 1},     /* (trace [level]) => previous level, 0=off, 1=on, 2=keypress */
    {0}
  };
  return table;
}

/* apply primitive i to arguments t */
L primitive(I i, const List& t) {
  const Prim& p = prim()[i];
  if (t.size() < p.lo || t.size() > p.hi) {
    if (p.lo == p.hi)
      ERR(ERR_ARGS, "%s takes %u argument(s), %u given", p.s, p.lo, static_cast<I>(t.size()));
    if (p.hi == MANY)
      ERR(ERR_ARGS, "%s takes at least %u argument(s), %u given", p.s, p.lo, static_cast<I>(t.size()));
    ERR(ERR_ARGS, "%s takes %u to %u arguments, %u given", p.s, p.lo, p.hi, static_cast<I>(t.size()));
  }
  return p.f(*this, t);
}

/*----------------------------------------------------------------------------*\
 |      SPECIAL FORMS                                                         |
\*----------------------------------------------------------------------------*/

protected:

/* (cond (test body ...) ... (else body ...)) => value of the last body expression of the first clause whose test
   is truthy, the value of the test when the clause has no body, or the no-value sentinel when no clause matches */
L f_cond(const List& t, const E& e) {
  for (size_t i = 1; i < t.size(); ++i) {
    const L& c = t[i];
    if (c->t != LIST || c->l.empty())
      continue;
    const List& s = c->l;
    L x = nothing;
    if (s[0]->t != ATOM || s[0]->s != "else") {
      x = eval(s[0], e);
      if (!truthy(x))
        continue;
    }
    for (size_t k = 1; k < s.size(); ++k)
      x = eval(s[k], e);
    return x;
  }
  return nothing;
}

/* (or x1 x2 ... xk) => first truthy xi, else the value of xk, else #f if k=0 */
L f_or(const List& t, const E& e) {
  L x = fls;
  for (size_t i = 1; i < t.size(); ++i)
    if (truthy(x = eval(t[i], e)))
      break;
  return x;
}

/* (and x1 x2 ... xk) => first falsy xi, else the value of xk, else #t if k=0 */
L f_and(const List& t, const E& e) {
  L x = tru;
  for (size_t i = 1; i < t.size(); ++i)
    if (!truthy(x = eval(t[i], e)))
      break;
  return x;
}

/* reserved keywords, recognized before a list head is looked up as a variable */
static I keyword(const L& x) {
  static const struct {
    const char *s;
    I f;
  } table[] = {
    {"quote",  QUOTE},                          /* (quote x) => x */
    {"if",     IF},                             /* (if x y z) => y if x is truthy else z */
    {"define", DEFINE},                         /* (define v x) and (define (v v1 ... vk) x1 ... xk) */
    {"lambda", LAMBDA},                         /* (lambda (v1 ... vk) x1 ... xk) => {lambda} */
    {"set!",   SET},                            /* (set! v x) -- changes value of v in scope to x */
    {"cond",   COND},
    {"or",     OR},
    {"and",    AND},
    {"begin",  BEGIN},                          /* (begin x1 x2 ... xk) => xk */
    {0, NONE}
  };
  if (x->t == ATOM)
    for (I i = 0; table[i].s; ++i)
      if (x->s == table[i].s)
        return table[i].f;
  return NONE;
}

/* nonzero if all items of t are symbols */
static I symbols(const List& t) {
  for (size_t i = 0; i < t.size(); ++i)
    if (t[i]->t != ATOM)
      return 0;
  return 1;
}

/* return the syntactic form of the items t of a list */
static I form(const List& t) {
  if (t.empty())
    return INVALID;
  size_t n = t.size();
  I k = keyword(t[0]);
  switch (k) {
    case QUOTE:
      return n == 2 ? QUOTE : INVALID;
    case IF:
      return n == 4 ? IF : INVALID;
    case DEFINE:
      if (n == 3 && t[1]->t == ATOM)
        return DEFINE;
      return n >= 3 && t[1]->t == LIST && !t[1]->l.empty() && symbols(t[1]->l) ? DEFUN : INVALID;
    case SET:
      return n == 3 && t[1]->t == ATOM ? SET : INVALID;
    case LAMBDA:
      return n >= 3 && t[1]->t == LIST && symbols(t[1]->l) ? LAMBDA : INVALID;
    case COND:
    case OR:
    case AND:
      return k;
    case BEGIN:
      return n >= 2 ? BEGIN : INVALID;
    default:
      return APPLY;
  }
}

/*----------------------------------------------------------------------------*\
 |      EVAL                                                                  |
\*----------------------------------------------------------------------------*/

public:

/* return the syntactic form of expression x, the form of a list is classified once */
static I classify(const L& x) {
  switch (x->t) {
    case INTG:
    case REAL:
    case BOOL:
      return SELF;
    case ATOM:
      return SYMBOL;
    case LIST:
      if (x->f == NONE)
        x->f = form(x->l);
      return x->f;
    default:
      return INVALID;
  }
}

/* construct a closure with parameters v, body t[k] ... t[n-1], and static scope e */
L closure(const List& v, const List& t, size_t k, const E& e) {
  L f = cell(CLOS);
  for (size_t i = 0; i < v.size(); ++i)
    f->v.push_back(v[i]->s);
  f->l.assign(t.begin()+k, t.end());
  f->e = e;
  return f;
}

/* return a new environment binding the parameters of closure f to the arguments t, a parameter without an
   argument is left unbound and extra arguments are ignored */
static E bind(const L& f, const List& t) {
  Env::Frame d;
  for (size_t i = 0; i < f->v.size() && i < t.size(); ++i)
    d[f->v[i]] = t[i];
  return f->e->extend(d);
}

/* apply procedure or primitive f to the arguments t, not tail-call optimized */
L call(const L& f, const List& t) {
  if (f->t == PRIM)
    return primitive(static_cast<I>(f->n), t);
  if (f->t != CLOS)
    return ERR(ERR_APPLY, "%s", show(f).c_str());
  E d = bind(f, t);
  L x;
  for (size_t i = 0; i < f->l.size(); ++i)
    x = eval(f->l[i], d);
  return x;
}

/* evaluate x in environment e and trace it, returns its value */
L eval(const L& x, const E& e) {
  L y;
  if (brk) {                                    /* CTRL-C was pressed */
    brk = 0;
    err(ERR_BREAK);
  }
  if (level >= MAXLEVEL)
    ERR(ERR_STACK, "%u nested evaluations", level);
  ++level;
  try {
    y = tr ? trace(x, e) : step(x, e);
  }
  catch (...) {
    --level;                                    /* release the level and pass the error on */
    throw;
  }
  --level;
  return y;
}

/* evaluate all expressions of source s in environment e, returns the value of the last one */
L run(const char *s, const E& e) {
  L x = nothing;
  source(s);
  while (more())
    x = eval(read(), e);
  return x;
}

/* evaluate all expressions of source s in a new top-level frame */
L run(const char *s) {
  return run(s, top());
}

protected:

/* step-wise evaluate x in environment e and print <depth>: <expr> => <value> */
L trace(const L& x, const E& e) {
  ++depth;
  L y = step(x, e);
  --depth;
  fprintf(stderr, "%4u: %s => %s", depth, show(x).c_str(), show(y).c_str());
  if (tr > 1)                                   /* wait for ENTER key or other CTRL */
    while (getchar() >= ' ')
      continue;
  else
    fputc('\n', stderr);
  return y;
}

/* evaluate the arguments t[1] ... t[n-1] of an application */
List evlis(const List& t, const E& e) {
  List s;
  s.reserve(t.size()-1);
  for (size_t i = 1; i < t.size(); ++i)
    s.push_back(eval(t[i], e));
  return s;
}

/* invoke primitive f with arguments t for application x, an argument failure is reported with the source */
L invoke(const L& f, const List& t, const L& x) {
  try {
    if (f->t != PRIM)
      ERR(ERR_APPLY, "%s", show(f).c_str());
    return primitive(static_cast<I>(f->n), t);
  }
  catch (int n) {
    if (n != ERR_LIST && n != ERR_APPLY && n != ERR_ARGS)
      throw;
    std::string s = why;
    culprit = x;
    return ERR(ERR_INVOKE, "%s %s\ninvoking: %s %s\nsource: %s", error(n), s.c_str(), show(f).c_str(),
        show(list(t)).c_str(), show(x).c_str());
  }
}

/* step-wise evaluate x in environment e, returns value of x, tail-call optimized */
L step(L x, E e) {
  while (1) {
    const List& t = x->l;
    switch (classify(x)) {
      case SELF:                                /* numbers and booleans evaluate to themselves */
        return x;
      case SYMBOL:                              /* return the value associated with the symbol */
        return e->lookup(x->s);
      case QUOTE:
        return t[1];
      case IF:                                  /* tail call: continue with the branch taken */
        x = L(truthy(eval(t[1], e)) ? t[2] : t[3]);
        continue;
      case DEFINE:
        e->define(t[1]->s, eval(t[2], e));
        return nothing;
      case SET:
        e->mutate(t[1]->s, eval(t[2], e));
        return nothing;
      case DEFUN: {
        const List& v = t[1]->l;
        L f = closure(List(v.begin()+1, v.end()), t, 2, e);
        f->s = v[0]->s;
        e->define(v[0]->s, f);
        return nothing;
      }
      case LAMBDA:
        return closure(t[1]->l, t, 2, e);
      case COND:
        return f_cond(t, e);
      case OR:
        return f_or(t, e);
      case AND:
        return f_and(t, e);
      case BEGIN:                               /* tail call: evaluate x1 ... xk-1 then continue with xk */
        for (size_t i = 1; i+1 < t.size(); ++i)
          eval(t[i], e);
        x = L(t.back());
        continue;
      case APPLY: {
        L f = eval(t[0], e);                    /* the procedure or primitive is at the head of the list */
        List s = evlis(t, e);                   /* ... and its actual arguments are the rest of the list */
        if (f->t != CLOS)                       /* if f is not a closure, then invoke it and return its value */
          return invoke(f, s, x);
        e = bind(f, s);                         /* the new environment e binds f's parameters in f's static scope */
        for (size_t i = 0; i+1 < f->l.size(); ++i)
          eval(f->l[i], e);
        x = f->l.back();                        /* tail recursion optimization: evaluate the last body expression */
        continue;
      }
      default:
        culprit = x;
        return ERR(ERR_SYNTAX, "%s", show(x).c_str());
    }
  }
}

/*----------------------------------------------------------------------------*\
 |      PRINT                                                                 |
\*----------------------------------------------------------------------------*/

public:

/* output expression x */
void print(const L& x) {
  fputs(show(x).c_str(), out);
}

/* return the printed form of expression x */
static std::string show(const L& x) {
  std::string s;
  show(s, x);
  return s;
}

/* return the shortest printed form of floating point number n that reads back as n, with a decimal point or
   exponent to tell it apart from an integer */
static std::string flonum(double n) {
  char buf[48];
  int i, k;
  if (std::isnan(n))
    return "nan";
  if (std::isinf(n))
    return n < 0 ? "-inf" : "inf";
  for (i = 0; i < 17; ++i) {                    /* fewest digits that read back as n */
    snprintf(buf, sizeof(buf), "%.*e", i, n);
    if (strtod(buf, NULL) == n)
      break;
  }
  k = atoi(strchr(buf, 'e')+1);                 /* decimal exponent */
  if (k >= -4 && k < 16) {
    snprintf(buf, sizeof(buf), "%.*f", i > k ? i-k : 0, n);
    if (!strchr(buf, '.'))
      strcat(buf, ".0");
  }
  return buf;
}

protected:

/* append the printed form of expression x to s */
static void show(std::string& s, const L& x) {
  char buf[32];
  switch (x->t) {
    case INTG:
      snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(x->n));
      s += buf;
      break;
    case REAL:
      s += flonum(x->r);
      break;
    case ATOM:
      s += x->s;
      break;
    case BOOL:
      s += x->n ? "#t" : "#f";
      break;
    case LIST:
      s += '(';
      for (size_t i = 0; i < x->l.size(); ++i) {
        if (i)
          s += ' ';
        show(s, x->l[i]);
      }
      s += ')';
      break;
    case PRIM:
      s += '<';
      s += prim()[x->n].s;
      s += '>';
      break;
    case CLOS:
      s += '{';
      s += x->s.empty() ? "lambda" : x->s;
      s += '}';
      break;
    default:
      s += "#<void>";
  }
}

};

} // namespace minischeme

#endif
