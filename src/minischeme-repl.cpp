// minischeme-repl.cpp C++17 REPL and batch runner, based on lisp-repl.cpp by Robert A. van Engelen 2022 BSD-3 license
// To enable readline: c++ -std=c++17 -o minischeme minischeme-repl.cpp -O2 -DHAVE_READLINE_H -lreadline
// To enable break with CTRL-C: c++ -std=c++17 -o minischeme minischeme-repl.cpp -O2 -DHAVE_SIGNAL_H -DHAVE_READLINE_H -lreadline

#include "minischeme.hpp"

using minischeme::Scheme;

// read file s into t, returns false if it cannot be read
static bool slurp(const char *s, std::string& t) {
  char buf[4096];
  size_t n;
  FILE *fd = fopen(s, "r");
  if (!fd)
    return false;
  while ((n = fread(buf, 1, sizeof(buf), fd)) > 0)
    t.append(buf, n);
  fclose(fd);
  return true;
}

// run file argv[i] with the NAME=VALUE options argv[i+1] ... as top-level definitions
static int batch(Scheme& lisp, int argc, char **argv, int i) {
  std::string text;
  Scheme::E e = lisp.top();
  if (!slurp(argv[i], text)) {
    printf("ERR cannot read %s\n", argv[i]);
    return 1;
  }
  for (int k = i+1; k < argc; ++k)
    lisp.option(argv[k], e);                    /* arguments other than NAME=VALUE are skipped */
  try {
    lisp.run(text.c_str(), e);
  }
  catch (int n) {
    printf("ERR %d: %s %s\n", n, lisp.error(n), lisp.why);
    if (n == Scheme::ERR_UNBOUND) {
      printf("    You can define it as an option:\n    $");
      for (int k = 0; k < argc; ++k)
        printf(" %s", argv[k]);
      printf(" %s=<value>\n", lisp.why);
    }
    return 1;
  }
  return 0;
}

// read, evaluate and print until .q or the end of input
static int repl(Scheme& lisp) {
  std::string text;
  Scheme::E e = lisp.top();
  using_history();
  fprintf(stderr, "To exit type .q\n");
  while (1) {
    lisp.unwind();
    lisp.prompt("> ");
    try {
      lisp.input(text);
      lisp.source(text.c_str());
      while (lisp.more()) {
        Scheme::L x = lisp.eval(lisp.read(), e);
        if (x != lisp.nothing) {
          lisp.print(x);
          putchar('\n');
        }
      }
    }
    catch (int i) {
      printf("ERR %d: %s %s\n", i, lisp.error(i), lisp.why);
    }
    catch (Scheme::QUIT) {
      printf("Bye!\n");
      break;
    }
  }
  return 0;
}

int main(int argc, char **argv) {
  Scheme lisp;
  int i = 1;
  if (i < argc && !strcmp(argv[i], "-t")) {     // trace evaluation steps
    lisp.tr = 1;
    ++i;
  }
  if (i < argc)
    return batch(lisp, argc, argv, i);
  return repl(lisp);
}
