// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Example usage of the jdoc library
//
// This example walks through reading a game settings file:
// - Loading a document from a file or from text
// - Reading strings, integers and booleans
// - Reading nested objects and arrays
// - Handling missing keys, wrong types and malformed files

#include "../accessor.h"
#include "../document.h"
#include "../error.h"
#include <iostream>
#include <string>
#include <vector>

#ifndef JDOC_SOURCE_DIR
#define JDOC_SOURCE_DIR "."
#endif

using jdoc::Document;
using jdoc::Node;

// Example 1: Read top-level settings
void example_settings(const Document& doc)
{
    std::cout << "\n=== Example 1: Top-level Settings ===" << std::endl;

    const Node& root = doc.root();
    std::string title = jdoc::readString(root, "gameTitle");
    long long players = jdoc::readNumberAsInt(root, "numPlayers");
    bool fullscreen = jdoc::readBool(root, "fullScreenMode");

    std::cout << "  gameTitle: " << title << std::endl;
    std::cout << "  numPlayers: " << players << std::endl;
    std::cout << "  fullScreenMode: " << (fullscreen ? "true" : "false") << std::endl;
}

// Example 2: Read a nested object
void example_nested(const Document& doc)
{
    std::cout << "\n=== Example 2: Nested Objects ===" << std::endl;

    Node screen = jdoc::readObject(doc.root(), "screenSize");
    std::cout << "  " << screen.path() << ": "
              << jdoc::readNumberAsInt(screen, "width") << "x"
              << jdoc::readNumberAsInt(screen, "height") << std::endl;
}

// Example 3: Read arrays
void example_arrays(const Document& doc)
{
    std::cout << "\n=== Example 3: Arrays ===" << std::endl;

    std::vector<std::string> levels = jdoc::readArrayOfString(doc.root(), "levels");
    for (size_t i = 0; i < levels.size(); ++i) {
        std::cout << "  level " << i << ": " << levels[i] << std::endl;
    }

    if (jdoc::hasKey(doc.root(), "enemies")) {
        std::vector<Node> enemies = jdoc::readArrayOfObject(doc.root(), "enemies");
        for (const Node& enemy : enemies) {
            std::cout << "  " << enemy.path() << ": "
                      << jdoc::readString(enemy, "kind")
                      << " hp=" << jdoc::readNumberAsInt(enemy, "hp")
                      << " speed=" << jdoc::readNumber(enemy, "speed") << std::endl;
        }
    }
}

// Example 4: Error handling
void example_error_handling(const Document& doc)
{
    std::cout << "\n=== Example 4: Error Handling ===" << std::endl;

    try {
        jdoc::readString(doc.root(), "difficulty");
    } catch (const jdoc::KeyNotFoundError& e) {
        std::cout << "  missing key (expected): " << e.what() << std::endl;
    }

    try {
        jdoc::readBool(doc.root(), "gameTitle");
    } catch (const jdoc::TypeMismatchError& e) {
        std::cout << "  wrong type (expected): " << e.what() << std::endl;
    }

    try {
        Document::loadFromText("{\n  \"gameTitle\": \"Broken\",\n  \"numPlayers\": 01\n}");
    } catch (const jdoc::ParseError& e) {
        std::cout << "  malformed text (expected): " << e.what() << std::endl;
    }

    try {
        Document::loadFromFile("no-such-settings.json");
    } catch (const jdoc::IoError& e) {
        std::cout << "  unreadable file (expected): " << e.what() << std::endl;
    }
}

int main(int argc, char** argv)
{
    std::string path = argc > 1 ? argv[1] : JDOC_SOURCE_DIR "/example/settings.json";

    std::cout << "jdoc Example Program" << std::endl;
    std::cout << "====================" << std::endl;

    try {
        Document doc = Document::loadFromFile(path);
        std::cout << "Loaded " << doc.source() << std::endl;

        example_settings(doc);
        example_nested(doc);
        example_arrays(doc);
        example_error_handling(doc);
    } catch (const jdoc::Error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
