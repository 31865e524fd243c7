#include <gtest/gtest.h>
#include "utils/properties.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace cubeprog;

TEST(PropertiesTest, DefaultConstructor) {
    Properties props;
    EXPECT_TRUE(props.empty());
    EXPECT_EQ(0u, props.size());
}

TEST(PropertiesTest, SetAndGetString) {
    Properties props;
    props.set("key1", std::string("value1"));

    EXPECT_EQ("value1", props.getString("key1"));
    EXPECT_EQ("", props.getString("nonexistent"));
    EXPECT_EQ("default", props.getString("nonexistent", "default"));
}

TEST(PropertiesTest, CStringValuesReadAsText) {
    Properties props;
    props.set("serial", "066DFF485550755187121615");

    EXPECT_EQ("066DFF485550755187121615", props.getString("serial"));
}

TEST(PropertiesTest, SetAndGetInt) {
    Properties props;
    props.set("int_key", 42);

    EXPECT_EQ(42, props.getInt("int_key"));
    EXPECT_EQ(0, props.getInt("nonexistent"));
    EXPECT_EQ(99, props.getInt("nonexistent", 99));
}

TEST(PropertiesTest, IntFromText) {
    Properties props;
    props.set("decimal", std::string("4000"));
    props.set("hex", std::string("0x10"));
    props.set("junk", std::string("12abc"));
    props.set("huge", std::string("99999999999999"));

    EXPECT_EQ(4000, props.getInt("decimal"));
    EXPECT_EQ(16, props.getInt("hex"));
    EXPECT_EQ(7, props.getInt("junk", 7));
    EXPECT_EQ(7, props.getInt("huge", 7));
}

TEST(PropertiesTest, SetAndGetBool) {
    Properties props;
    props.set("bool_key", true);

    EXPECT_TRUE(props.getBool("bool_key"));
    EXPECT_FALSE(props.getBool("nonexistent"));
    EXPECT_TRUE(props.getBool("nonexistent", true));
}

TEST(PropertiesTest, BoolFromText) {
    Properties props;
    props.set("a", std::string("true"));
    props.set("b", std::string("yes"));
    props.set("c", std::string("on"));
    props.set("d", std::string("1"));
    props.set("e", std::string("false"));
    props.set("f", std::string("off"));

    EXPECT_TRUE(props.getBool("a"));
    EXPECT_TRUE(props.getBool("b"));
    EXPECT_TRUE(props.getBool("c"));
    EXPECT_TRUE(props.getBool("d"));
    EXPECT_FALSE(props.getBool("e", true));
    EXPECT_FALSE(props.getBool("f", true));
}

TEST(PropertiesTest, TypeMismatchReturnsDefault) {
    Properties props;
    props.set("number", 3.5);

    EXPECT_EQ("fallback", props.getString("number", "fallback"));
    EXPECT_EQ(5, props.getInt("number", 5));
    EXPECT_TRUE(props.getBool("number", true));
}

TEST(PropertiesTest, GetAs) {
    Properties props;
    props.set("frequency", 4000);

    auto value = props.getAs<int>("frequency");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(4000, *value);

    EXPECT_FALSE(props.getAs<std::string>("frequency").has_value());
    EXPECT_FALSE(props.getAs<int>("missing").has_value());
}

TEST(PropertiesTest, HasRemoveAndKeys) {
    Properties props;
    props.set("b", 1);
    props.set("a", 2);

    EXPECT_TRUE(props.has("a"));
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), props.keys());

    EXPECT_TRUE(props.remove("a"));
    EXPECT_FALSE(props.remove("a"));
    EXPECT_FALSE(props.has("a"));

    props.clear();
    EXPECT_TRUE(props.empty());
}

TEST(PropertiesTest, Merge) {
    Properties base;
    base.set("keep", 1);
    base.set("override", 1);

    Properties extra;
    extra.set("override", 2);
    extra.set("added", 3);

    base.merge(extra);
    EXPECT_EQ(1, base.getInt("keep"));
    EXPECT_EQ(2, base.getInt("override"));
    EXPECT_EQ(3, base.getInt("added"));

    base.merge(base);
    EXPECT_EQ(3u, base.size());
}

TEST(PropertiesTest, CopyAndMove) {
    Properties original;
    original.set("key", std::string("value"));

    Properties copy(original);
    EXPECT_EQ("value", copy.getString("key"));

    Properties moved(std::move(copy));
    EXPECT_EQ("value", moved.getString("key"));

    Properties assigned;
    assigned = original;
    EXPECT_EQ("value", assigned.getString("key"));
}

TEST(PropertiesTest, ConcurrentAccess) {
    Properties props;
    std::atomic<int> reads{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&props, t]() {
            for (int i = 0; i < 100; ++i) {
                props.set("key" + std::to_string(t), i);
            }
        });
        threads.emplace_back([&props, &reads, t]() {
            for (int i = 0; i < 100; ++i) {
                props.getInt("key" + std::to_string(t));
                ++reads;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(400, reads.load());
    for (int t = 0; t < 4; ++t) {
        EXPECT_EQ(99, props.getInt("key" + std::to_string(t)));
    }
}
