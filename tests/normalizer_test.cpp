#include <stdexcept>

#include <gtest/gtest.h>

#include "normalizer.hpp"
#include "test_problems.hpp"

using namespace test_problems;

TEST(normalizer, all_less_equal_gets_one_slack_per_row) {
    tableau_layout l = normalize(production(), init_method::standard);

    EXPECT_EQ(l.s, 3);
    EXPECT_EQ(l.a, 0);
    EXPECT_EQ(l.cols(), 6);
    EXPECT_EQ(l.rhs_col(), 5);
    EXPECT_EQ(l.slack_col, (idx{2, 3, 4}));
    EXPECT_EQ(l.artificial_col, (idx{-1, -1, -1}));
    EXPECT_EQ(l.variable_names, (std::vector<std::string>{"x1", "x2", "s1", "s2", "s3"}));
}

TEST(normalizer, mixed_relations_with_artificials) {
    Problem p = make(objective_sense::maximize,
                     {1, 1},
                     {row({1, 0}, relation::less_equal, 4),
                      row({0, 1}, relation::greater_equal, 1),
                      row({1, 1}, relation::equal, 3)});

    for (init_method method : {init_method::big_m, init_method::two_phase}) {
        tableau_layout l = normalize(p, method);
        EXPECT_EQ(l.s, 2);
        EXPECT_EQ(l.a, 2);
        EXPECT_EQ(l.cols(), 7);
        EXPECT_EQ(l.slack_col, (idx{2, 3, -1}));
        EXPECT_EQ(l.slack_coeff, (vec{1, -1, 0}));
        EXPECT_EQ(l.artificial_col, (idx{-1, 4, 5}));
        EXPECT_TRUE(l.is_artificial(4));
        EXPECT_TRUE(l.is_artificial(5));
        EXPECT_FALSE(l.is_artificial(3));
        EXPECT_EQ(l.variable_names,
                  (std::vector<std::string>{"x1", "x2", "s1", "s2", "a1", "a2"}));
    }
}

TEST(normalizer, minimization_negates_cost) {
    tableau_layout l = normalize(diet(), init_method::two_phase);
    EXPECT_EQ(l.cost, (vec{-2, -3}));

    tableau_layout l2 = normalize(production(), init_method::standard);
    EXPECT_EQ(l2.cost, (vec{3, 5}));
}

TEST(normalizer, negative_rhs_is_mirrored_for_artificial_methods) {
    tableau_layout l = normalize(negative_rhs(), init_method::big_m);

    EXPECT_EQ(l.row_sign, (vec{-1, 1, 1}));
    EXPECT_EQ(l.rel[0], relation::greater_equal);
    EXPECT_EQ(l.slack_coeff[0], -1);
    EXPECT_EQ(l.artificial_col[0], l.n + l.s);
    EXPECT_EQ(l.a, 1);
}

TEST(normalizer, standard_flips_greater_equal_rows) {
    // -x1 >= -4 is x1 <= 4.
    Problem p = make(objective_sense::maximize,
                     {3, 5},
                     {row({-1, 0}, relation::greater_equal, -4),
                      row({0, 2}, relation::less_equal, 12)});
    tableau_layout l = normalize(p, init_method::standard);

    EXPECT_EQ(l.row_sign, (vec{-1, 1}));
    EXPECT_EQ(l.rel[0], relation::less_equal);
    EXPECT_EQ(l.slack_coeff, (vec{1, 1}));
    EXPECT_EQ(l.a, 0);
}

TEST(normalizer, standard_rejects_rows_without_slack_basis) {
    EXPECT_THROW(normalize(disjoint(), init_method::standard), std::invalid_argument);
    EXPECT_THROW(normalize(equality(), init_method::standard), std::invalid_argument);
    EXPECT_THROW(normalize(negative_rhs(), init_method::standard), std::invalid_argument);
}
