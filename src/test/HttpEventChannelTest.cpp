#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "infrastructure/HttpEventChannel.hpp"

using voicescribe::infrastructure::HttpEventChannel;

static void TestJsonReply() {
    std::cout << "[Test] JSON reply before streaming..." << std::endl;
    HttpEventChannel channel;
    std::thread producer([&] {
        channel.respond(400, {{"error", "bad"}});
        channel.close();
    });
    assert(channel.awaitMode() == HttpEventChannel::Mode::Json);
    producer.join();
    assert(channel.status() == 400);
    assert(channel.body()["error"] == "bad");
}

static void TestSilentProducer() {
    std::cout << "[Test] Producer closing without a reply..." << std::endl;
    HttpEventChannel channel;
    channel.close();
    assert(channel.awaitMode() == HttpEventChannel::Mode::Json);
    assert(channel.status() == 500);
}

static void TestFramesInOrder() {
    std::cout << "[Test] Frames are delivered in order..." << std::endl;
    HttpEventChannel channel;
    std::thread producer([&] {
        channel.open();
        for (int i = 0; i < 50; ++i) {
            assert(channel.write("frame " + std::to_string(i)));
        }
        channel.respond(500, {{"error", "too late"}});
        channel.close();
    });
    assert(channel.awaitMode() == HttpEventChannel::Mode::Stream);

    std::vector<std::string> received;
    std::string frame;
    while (channel.next(frame)) {
        received.push_back(frame);
    }
    producer.join();
    assert(received.size() == 50);
    assert(received.front() == "frame 0" && received.back() == "frame 49");
}

static void TestCancel() {
    std::cout << "[Test] Cancel unblocks the producer..." << std::endl;
    HttpEventChannel channel;
    bool secondWrite = true;
    std::thread producer([&] {
        channel.open();
        channel.write("first");
        secondWrite = channel.write("second");
        channel.close();
    });
    assert(channel.awaitMode() == HttpEventChannel::Mode::Stream);
    std::string frame;
    assert(channel.next(frame) && frame == "first");
    channel.cancel();
    producer.join();
    assert(!secondWrite || !channel.next(frame));
    assert(!channel.write("after cancel"));
}

int main() {
    std::cout << "[Test] Starting HttpEventChannel Test..." << std::endl;
    TestJsonReply();
    TestSilentProducer();
    TestFramesInOrder();
    TestCancel();
    std::cout << "[PASS] Event channel hands frames across threads." << std::endl;
    return 0;
}
