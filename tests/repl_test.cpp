// repl_test.cpp command line options and multi-line REPL input

#include <cstdio>

#include "scheme_test.hpp"

namespace {

class OptionTest : public SchemeTest { };

// reads the REPL input from a temporary file instead of the terminal
class InputTest : public SchemeTest {
 protected:
  std::string text;

  ~InputTest() override {
    if (lisp.in && lisp.in != stdin)
      fclose(lisp.in);
  }

  // the lines s are what the user types next
  void type(const char *s) {
    if (lisp.in && lisp.in != stdin)
      fclose(lisp.in);
    lisp.in = tmpfile();
    ASSERT_NE(lisp.in, nullptr);
    fputs(s, lisp.in);
    rewind(lisp.in);
  }

  // read the next input, returns the error code thrown or 0 when none
  int input_fails() {
    try {
      lisp.input(text);
    }
    catch (int n) {
      return n;
    }
    return 0;
  }
};

}  // namespace

TEST_F(OptionTest, NameValueDefinesANumber) {
  EXPECT_EQ(lisp.option("n=21", e), 1u);
  EXPECT_EQ(e->lookup("n")->t, Scheme::INTG);
  EXPECT_EQ(eval("(* n 2)"), "42");
}

TEST_F(OptionTest, ValueReadsAsALiteral) {
  EXPECT_EQ(lisp.option("r=2.5", e), 1u);
  EXPECT_EQ(lisp.option("s=abc", e), 1u);
  EXPECT_EQ(e->lookup("r")->t, Scheme::REAL);
  EXPECT_EQ(e->lookup("s")->t, Scheme::ATOM);
  EXPECT_EQ(eval("s"), "abc");
}

TEST_F(OptionTest, MalformedOptionsAreSkipped) {
  EXPECT_EQ(lisp.option("=x", e), 0u);
  EXPECT_EQ(lisp.option("x=", e), 0u);
  EXPECT_EQ(lisp.option("a=b=c", e), 0u);
  EXPECT_EQ(lisp.option("plain", e), 0u);
  EXPECT_TRUE(e->frame.empty());
  EXPECT_EQ(fails("x"), Scheme::ERR_UNBOUND);
  EXPECT_EQ(fails("a"), Scheme::ERR_UNBOUND);
}

TEST_F(OptionTest, OptionsGoIntoTheGivenFrame) {
  lisp.option("car=1", e);
  EXPECT_EQ(eval("car"), "1");
  EXPECT_EQ(Scheme::show(lisp.env->lookup("car")), "<car>");
}

TEST_F(InputTest, LinesAreJoinedUntilTheBracketsBalance) {
  type("(+ 1\n   [* 2\n 3])\n(- 1)\n");
  lisp.input(text);
  EXPECT_EQ(text, "(+ 1\n   [* 2\n 3])\n");
  EXPECT_EQ(Scheme::show(lisp.run(text.c_str(), e)), "7");
  lisp.input(text);
  EXPECT_EQ(text, "(- 1)\n");
}

TEST_F(InputTest, SeveralExpressionsOnOneLine) {
  type("(define a 1) (+ a 1)  \n");
  lisp.input(text);
  EXPECT_EQ(text, "(define a 1) (+ a 1)\n");
  EXPECT_EQ(Scheme::show(lisp.run(text.c_str(), e)), "2");
}

TEST_F(InputTest, BracketsInCommentsAreNotCounted) {
  type("(list 1 ; (\n 2)\n");
  lisp.input(text);
  EXPECT_EQ(text, "(list 1 ; (\n 2)\n");
  EXPECT_EQ(Scheme::show(lisp.run(text.c_str(), e)), "(1 2)");
}

TEST_F(InputTest, QuitCommand) {
  type(".q\n");
  EXPECT_THROW(lisp.input(text), Scheme::QUIT);
}

TEST_F(InputTest, EndOfInputQuits) {
  type("");
  EXPECT_THROW(lisp.input(text), Scheme::QUIT);
  type("(+ 1\n");
  EXPECT_THROW(lisp.input(text), Scheme::QUIT);
}

TEST_F(InputTest, UnexpectedCloseBracket) {
  type("1)\n(+ 1 2)\n");
  EXPECT_EQ(input_fails(), Scheme::ERR_READ);
  EXPECT_EQ(input_fails(), 0);
  EXPECT_EQ(text, "(+ 1 2)\n");
}
