// main.cpp
// Live Edit Example - One producer, one observer
//
// Type lines to append them to an open post. Every edit is diffed against
// the body the observer last received, serialized, and applied to the
// observer's replica. Both trees are printed after each step so they can be
// compared.
//
// Commands:
//   <text>    append text
//   \b        backspace
//   \n        line break
//   \bold X   append X in bold
//   \close    close the post
//   \q        quit

#include <post_body/body_editor.h>
#include <post_body/body_replica.h>
#include <post_body/serialization.h>

#include <iostream>
#include <string>

using namespace post_body;

int main()
{
    constexpr uint64_t post_id = 1;

    BodyReplicaSet observer;
    observer.insert(post_id, Node{});
    observer.set_effects({
        .on_resync_needed = [](uint64_t id, const PatchResult& result) {
            std::cout << "  [observer] post " << id << " needs resync: " << result.error_message << "\n";
        },
    });

    BodyEditor editor{post_id};
    std::size_t bytes_sent = 0;
    editor.set_effects({
        .on_patch = [&](BodyPatch patch) {
            std::cout << "  [patch] " << patch.patch << "\n";
            ByteBuffer wire = serialize(patch);
            bytes_sent += wire.size();
            auto result = observer.apply_bytes(wire);
            if (!result) {
                observer.insert(post_id, editor.snapshot());
            }
        },
        .on_closed = [](uint64_t id) {
            std::cout << "  [editor] post " << id << " closed\n";
        },
    });

    std::cout << "=== Live Edit Example ===\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "\\q") {
            break;
        } else if (line == "\\b") {
            editor.backspace();
        } else if (line == "\\n") {
            editor.append_node(Node::newline());
        } else if (line == "\\close") {
            editor.close();
        } else if (line.rfind("\\bold ", 0) == 0) {
            editor.append_node(Node::bold(Node::text(line.substr(6))));
        } else {
            editor.append_text(line);
        }

        std::cout << "editor:   " << editor.body() << " (" << editor.length() << " chars)\n";
        if (const Node* replica = observer.find(post_id)) {
            std::cout << "observer: " << *replica << "\n";
        }
    }

    std::cout << "\n" << editor.patch_count() << " patches, " << bytes_sent << " bytes sent\n";
    return 0;
}
