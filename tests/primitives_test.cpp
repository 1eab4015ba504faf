// primitives_test.cpp the standard global environment

#include <cstring>

#include "scheme_test.hpp"

namespace {

class PrimitivesTest : public SchemeTest { };

}  // namespace

TEST_F(PrimitivesTest, Addition) {
  EXPECT_EQ(eval("(+)"), "0");
  EXPECT_EQ(eval("(+ 1 2 3)"), "6");
  EXPECT_EQ(eval("(+ 1 2.5)"), "3.5");
}

TEST_F(PrimitivesTest, Subtraction) {
  EXPECT_EQ(eval("(- 5)"), "-5");
  EXPECT_EQ(eval("(- 2.5)"), "-2.5");
  EXPECT_EQ(eval("(- 10 1 2)"), "7");
}

TEST_F(PrimitivesTest, Multiplication) {
  EXPECT_EQ(eval("(*)"), "1");
  EXPECT_EQ(eval("(* 2 3 4)"), "24");
  EXPECT_EQ(eval("(* 2 0.5)"), "1.0");
}

TEST_F(PrimitivesTest, IntegerOverflowFallsBackToFloating) {
  EXPECT_EQ(lisp.run("(* 9223372036854775807 2)", e)->t, Scheme::REAL);
  EXPECT_EQ(lisp.run("(+ 9223372036854775807 1)", e)->t, Scheme::REAL);
}

TEST_F(PrimitivesTest, DivisionIsFloating) {
  EXPECT_EQ(eval("(/ 6 3)"), "2.0");
  EXPECT_EQ(eval("(/ 2)"), "0.5");
  EXPECT_EQ(eval("(/ 1 2 2)"), "0.25");
  EXPECT_EQ(fails("(/ 1 0)"), Scheme::ERR_INVOKE);
  EXPECT_NE(strstr(Scheme::why, "division by zero"), nullptr);
}

TEST_F(PrimitivesTest, Quotient) {
  EXPECT_EQ(eval("(quotient 7 2)"), "3");
  EXPECT_EQ(eval("(quotient -7 2)"), "-4");
  EXPECT_EQ(eval("(quotient 7.5 2)"), "3.0");
  EXPECT_EQ(fails("(quotient 1 0)"), Scheme::ERR_INVOKE);
}

TEST_F(PrimitivesTest, AbsRoundMaxMin) {
  EXPECT_EQ(eval("(abs -3)"), "3");
  EXPECT_EQ(eval("(abs -3.5)"), "3.5");
  EXPECT_EQ(eval("(round 2.5)"), "2");
  EXPECT_EQ(eval("(round 3.5)"), "4");
  EXPECT_EQ(eval("(round 7)"), "7");
  EXPECT_EQ(eval("(max 1 3.5 2)"), "3.5");
  EXPECT_EQ(eval("(min 4 2 8)"), "2");
}

TEST_F(PrimitivesTest, Math) {
  EXPECT_EQ(eval("(sqrt 16)"), "4.0");
  EXPECT_EQ(eval("(floor 2.7)"), "2");
  EXPECT_EQ(eval("(ceil 2.1)"), "3");
  EXPECT_EQ(eval("(pow 2 10)"), "1024.0");
  EXPECT_EQ(eval("(exp 0)"), "1.0");
  EXPECT_EQ(eval("(< 3.14159 pi 3.1416)"), "#t");
  EXPECT_EQ(fails("(sqrt -1)"), Scheme::ERR_INVOKE);
}

TEST_F(PrimitivesTest, NonNumericArgument) {
  EXPECT_EQ(fails("(+ 1 'a)"), Scheme::ERR_INVOKE);
  EXPECT_NE(strstr(Scheme::why, "not a number a"), nullptr);
  EXPECT_EQ(fails("(- #t)"), Scheme::ERR_INVOKE);
}

TEST_F(PrimitivesTest, Comparisons) {
  EXPECT_EQ(eval("(< 1 2 3)"), "#t");
  EXPECT_EQ(eval("(< 1 3 2)"), "#f");
  EXPECT_EQ(eval("(> 3 2 1)"), "#t");
  EXPECT_EQ(eval("(>= 3 3 1)"), "#t");
  EXPECT_EQ(eval("(<= 1 1 0)"), "#f");
  EXPECT_EQ(eval("(= 1 1.0)"), "#t");
  EXPECT_EQ(eval("(= 1 2)"), "#f");
  EXPECT_EQ(eval("(= '(1 a) '(1 a))"), "#t");
  EXPECT_EQ(eval("(< 'a 'b)"), "#t");
  EXPECT_EQ(fails("(< 1 'a)"), Scheme::ERR_INVOKE);
}

TEST_F(PrimitivesTest, ListOperations) {
  EXPECT_EQ(eval("(car '(1 2))"), "1");
  EXPECT_EQ(eval("(cdr '(1 2))"), "(2)");
  EXPECT_EQ(eval("(cdr '())"), "()");
  EXPECT_EQ(eval("(cons 1 '(2))"), "(1 2)");
  EXPECT_EQ(eval("(list 1 'a)"), "(1 a)");
  EXPECT_EQ(eval("(list)"), "()");
  EXPECT_EQ(eval("(append '(1) '(2 3) '())"), "(1 2 3)");
  EXPECT_EQ(eval("(length '(1 2 3))"), "3");
}

TEST_F(PrimitivesTest, ListOperationsRejectNonLists) {
  EXPECT_EQ(fails("(car '())"), Scheme::ERR_INVOKE);
  EXPECT_EQ(fails("(cons 1 2)"), Scheme::ERR_INVOKE);
  EXPECT_NE(strstr(Scheme::why, "not a list 2"), nullptr);
  EXPECT_EQ(fails("(length 5)"), Scheme::ERR_INVOKE);
}

TEST_F(PrimitivesTest, HigherOrder) {
  EXPECT_EQ(eval("(apply + '(1 2 3))"), "6");
  EXPECT_EQ(eval("(apply (lambda (a b) (- a b)) '(5 2))"), "3");
  EXPECT_EQ(eval("(map (lambda (x) (* x x)) '(1 2 3))"), "(1 4 9)");
  EXPECT_EQ(eval("(map + '(1 2 3) '(10 20))"), "(11 22)");
  EXPECT_EQ(eval("(filter (lambda (x) (> x 1)) '(1 2 3))"), "(2 3)");
  EXPECT_EQ(fails("(apply 5 '())"), Scheme::ERR_INVOKE);
}

TEST_F(PrimitivesTest, Predicates) {
  EXPECT_EQ(eval("(eq? 'a 'a)"), "#t");
  EXPECT_EQ(eval("(eq? '(1) '(1))"), "#f");
  EXPECT_EQ(eval("(eq? '() '())"), "#t");
  EXPECT_EQ(eval("(define l '(1)) (eq? l l)"), "#t");
  EXPECT_EQ(eval("(equal? '(1 (2)) '(1 (2)))"), "#t");
  EXPECT_EQ(eval("(not 0)"), "#t");
  EXPECT_EQ(eval("(not 'a)"), "#f");
  EXPECT_EQ(eval("(null? '())"), "#t");
  EXPECT_EQ(eval("(null? 0)"), "#f");
  EXPECT_EQ(eval("(list? '(1))"), "#t");
  EXPECT_EQ(eval("(number? 2.5)"), "#t");
  EXPECT_EQ(eval("(number? 'a)"), "#f");
  EXPECT_EQ(eval("(symbol? 'a)"), "#t");
  EXPECT_EQ(eval("(procedure? car)"), "#t");
  EXPECT_EQ(eval("(procedure? (lambda () 1))"), "#t");
  EXPECT_EQ(eval("(procedure? 1)"), "#f");
}

TEST_F(PrimitivesTest, WrongArgumentCount) {
  EXPECT_EQ(fails("(car)"), Scheme::ERR_INVOKE);
  EXPECT_NE(strstr(Scheme::why, "car takes 1 argument(s), 0 given"), nullptr);
  EXPECT_EQ(fails("(-)"), Scheme::ERR_INVOKE);
  EXPECT_NE(strstr(Scheme::why, "- takes at least 1 argument(s), 0 given"), nullptr);
}

TEST_F(PrimitivesTest, PrimitivesCanBeRebound) {
  EXPECT_EQ(eval("(define (car x) 'mine) (car '(1))"), "mine");
}
