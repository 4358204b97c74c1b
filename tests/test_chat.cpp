#include "SimNetwork.hpp"

#include "core/Error.h"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <memory>

using namespace groupride;
using groupride::chat::ChatService;
using groupride::chat::ChatStatus;
using groupride::session::SessionState;
using sim::SimNetwork;
using sim::SimNode;

namespace {

void form_session(SimNetwork& net, std::vector<SimNode*> nodes) {
    auto& host = *nodes[0];
    assert(!host.session.host("watopia", host.local(net.now())));
    net.run_for(Millis(50));
    for (std::size_t i = 1; i < nodes.size(); ++i) {
        assert(!nodes[i]->session.join(host.session.session()->id, nodes[i]->local(net.now())));
    }
    const bool ok = net.run_until([&] {
        return std::all_of(nodes.begin(), nodes.end(), [&](SimNode* n) {
            return n->session.state() == SessionState::Active && n->session.members().size() == nodes.size();
        });
    }, Millis(2000));
    assert(ok);
}

std::vector<std::uint32_t> received_ids(const SimNode& n, const RiderId& from) {
    std::vector<std::uint32_t> ids;
    for (const auto& [at, ev] : n.observed<events::ChatReceived>()) {
        if (ev.entry.sender == from) ids.push_back(ev.entry.message_id);
    }
    return ids;
}

ChatStatus status_of(const SimNode& n, std::uint32_t id) {
    auto entry = n.chat.find(n.id(), id);
    assert(entry);
    return entry->status;
}

bool is_chat(const protocol::Message& msg, std::uint32_t id) {
    auto* m = msg.as<protocol::ChatMessage>();
    return m && m->message_id == id;
}

// A chat service driven by hand, already in a session with b and c.
struct Solo {
    Config cfg;
    sim::RecordingOutbox out;
    Rider me{RiderId("rider-a"), "alice"};
    ChatService chat{me, cfg, out};
    std::vector<events::Event> events;
    TimePoint t0 = sim::epoch();

    Solo() {
        chat.set_on_event([this](const events::Event& e) { events.push_back(e); });
        chat.open("session-1");
        chat.set_roster({"rider-a", "rider-b", "rider-c"});
    }

    protocol::Message ack(const RiderId& from, std::uint32_t id) const {
        return protocol::make_message(from, t0 + Millis(5), protocol::ChatAck{me.id(), id});
    }

    std::vector<events::ChatStatusChanged> statuses() const {
        std::vector<events::ChatStatusChanged> s;
        for (const auto& e : events) {
            if (auto* c = std::get_if<events::ChatStatusChanged>(&e)) s.push_back(*c);
        }
        return s;
    }
};

} // namespace

int main() {
    printf("=== chat test suite ===\n");
    log::set_level(log::Level::warn);

    // --- Every member acks: delivered once each ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        auto& c = net.add("carol");
        auto& d = net.add("dave");
        form_session(net, {&a, &b, &c, &d});

        std::uint32_t id = 0;
        assert(!a.chat.send("  hello everyone ", a.local(net.now()), &id));
        assert(id == 1);
        assert(status_of(a, id) == ChatStatus::Pending);

        net.run_for(Millis(200));
        assert(status_of(a, id) == ChatStatus::Delivered);

        auto statuses = a.observed<events::ChatStatusChanged>();
        assert(statuses.back().second.status == ChatStatus::Delivered);
        assert(statuses.back().second.acked == 3);
        assert(statuses.back().second.recipients == 3);

        for (auto* n : {&b, &c, &d}) {
            auto got = n->observed<events::ChatReceived>();
            assert(got.size() == 1);
            assert(got[0].second.entry.text == "hello everyone");
            assert(got[0].second.entry.sender == a.id());
            assert(got[0].second.entry.status == ChatStatus::Received);
        }
        printf("  [OK] Message delivered to every member once\n");
    }

    // --- Lost ack: resent, still delivered once ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        auto& c = net.add("carol");
        form_session(net, {&a, &b, &c});

        auto dropped = std::make_shared<int>(0);
        net.drop_if([dropped, &b](const SimNode& from, const SimNode&, const protocol::Message& msg) {
            return from.id() == b.id() && msg.as<protocol::ChatAck>() && (*dropped)++ == 0;
        });

        std::uint32_t id = 0;
        assert(!a.chat.send("on your left", a.local(net.now()), &id));
        net.run_for(Millis(300));
        assert(status_of(a, id) == ChatStatus::Pending);
        assert(a.observed<events::ChatStatusChanged>().back().second.acked == 1);

        net.run_for(Millis(700));
        assert(status_of(a, id) == ChatStatus::Delivered);
        assert(*dropped >= 2);
        assert(b.count<events::ChatReceived>() == 1);
        assert(b.chat.log().size() == 1);
        printf("  [OK] Lost ack resends without duplicate delivery\n");
    }

    // --- Reordered delivery is released in send order ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        form_session(net, {&a, &b});

        auto dropped = std::make_shared<bool>(false);
        net.drop_if([dropped, &b](const SimNode&, const SimNode& to, const protocol::Message& msg) {
            if (to.id() != b.id() || !is_chat(msg, 2) || *dropped) return false;
            *dropped = true;
            return true;
        });

        const auto sent_at = net.now();
        for (const char* text : {"one", "two", "three"}) {
            assert(!a.chat.send(text, a.local(net.now())));
        }
        net.run_for(Millis(300));
        assert(received_ids(b, a.id()) == std::vector<std::uint32_t>{1});

        net.run_for(Millis(500));
        assert((received_ids(b, a.id()) == std::vector<std::uint32_t>{1, 2, 3}));
        auto got = b.observed<events::ChatReceived>();
        assert(got[1].first - sent_at >= Millis(500));
        assert(got[2].second.entry.text == "three");
        printf("  [OK] Held message released after the gap fills\n");
    }

    // --- Permanent loss: gap skipped at the receiver, failed at the sender ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        auto& c = net.add("carol");
        form_session(net, {&a, &b, &c});

        net.drop_if([&b](const SimNode&, const SimNode& to, const protocol::Message& msg) {
            return to.id() == b.id() && is_chat(msg, 2);
        });

        for (const char* text : {"one", "two", "three"}) {
            assert(!a.chat.send(text, a.local(net.now())));
        }
        net.run_for(Millis(1900));
        assert(received_ids(b, a.id()) == std::vector<std::uint32_t>{1});
        assert((received_ids(c, a.id()) == std::vector<std::uint32_t>{1, 2, 3}));

        net.run_for(Millis(200));
        assert((received_ids(b, a.id()) == std::vector<std::uint32_t>{1, 3}));

        net.run_for(Millis(11000 - 2100));
        assert(status_of(a, 1) == ChatStatus::Delivered);
        assert(status_of(a, 2) == ChatStatus::Pending);
        assert(status_of(a, 3) == ChatStatus::Delivered);

        net.run_for(Millis(1000));
        assert(status_of(a, 2) == ChatStatus::Failed);
        auto last = a.observed<events::ChatStatusChanged>().back().second;
        assert(last.message_id == 2);
        assert(last.status == ChatStatus::Failed);
        assert(last.acked == 1);
        assert(last.recipients == 2);
        printf("  [OK] Gap skipped after hold, sender gives up after five attempts\n");
    }

    // --- Retry schedule ---
    {
        Solo s;
        s.chat.set_roster({"rider-a", "rider-b"});
        assert(!s.chat.send("ping", s.t0));
        auto sends = [&] { return s.out.bodies<protocol::ChatMessage>().size(); };
        assert(sends() == 1);

        std::vector<Millis> at;
        for (Millis t{0}; t <= Millis(12000); t += Millis(10)) {
            const auto before = sends();
            s.chat.tick(s.t0 + t);
            if (sends() > before) at.push_back(t);
        }
        assert((at == std::vector<Millis>{Millis(500), Millis(1500), Millis(3500), Millis(7500)}));
        assert(s.chat.find("rider-a", 1)->status == ChatStatus::Failed);

        // resends carry the original send time
        for (const auto& sent : s.out.sent) assert(sent.msg.sent_at == to_wire_ms(s.t0));
        printf("  [OK] Exponential backoff capped, gives up on the fifth\n");
    }

    // --- Duplicates acked every time, delivered once ---
    {
        Solo s;
        auto first = protocol::make_message("rider-b", s.t0, protocol::ChatMessage{1, "hi"});
        s.chat.handle(first, s.t0 + Millis(5));
        s.chat.handle(first, s.t0 + Millis(600));

        auto acks = s.out.bodies<protocol::ChatAck>();
        assert(acks.size() == 2);
        assert(acks[0].original_sender == "rider-b");
        assert(acks[0].message_id == 1);
        assert(s.out.sent[0].rider == RiderId("rider-b"));
        assert(s.chat.log().size() == 1);
        assert(s.chat.log()[0].sent_at == s.t0);
        printf("  [OK] Duplicates deduplicated\n");
    }

    // --- Streams start at id 1; later ids wait for the gap ---
    {
        Solo s;
        s.chat.handle(protocol::make_message("rider-b", s.t0, protocol::ChatMessage{7, "seven"}), s.t0);
        s.chat.handle(protocol::make_message("rider-b", s.t0, protocol::ChatMessage{7, "seven"}), s.t0 + Millis(600));
        assert(s.chat.log().empty());
        assert(s.out.bodies<protocol::ChatAck>().size() == 2);

        s.chat.tick(s.t0 + Millis(1999));
        assert(s.chat.log().empty());
        s.chat.tick(s.t0 + Millis(2000));
        assert(s.chat.log().size() == 1);
        assert(s.chat.log()[0].message_id == 7);

        // a copy from inside the skipped gap still arrives once
        auto late = protocol::make_message("rider-b", s.t0, protocol::ChatMessage{3, "late"});
        s.chat.handle(late, s.t0 + Millis(2100));
        s.chat.handle(late, s.t0 + Millis(2200));
        assert(s.chat.log().size() == 2);
        assert(s.chat.log()[1].message_id == 3);
        printf("  [OK] Gap before the first seen id held, then skipped\n");
    }

    // --- Sender's first message lost: still released in order ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        form_session(net, {&a, &b});

        auto dropped = std::make_shared<bool>(false);
        net.drop_if([dropped, &b](const SimNode&, const SimNode& to, const protocol::Message& msg) {
            if (to.id() != b.id() || !is_chat(msg, 1) || *dropped) return false;
            *dropped = true;
            return true;
        });

        assert(!a.chat.send("one", a.local(net.now())));
        assert(!a.chat.send("two", a.local(net.now())));
        net.run_for(Millis(300));
        assert(received_ids(b, a.id()).empty());

        net.run_for(Millis(500));
        assert(*dropped);
        assert((received_ids(b, a.id()) == std::vector<std::uint32_t>{1, 2}));
        auto got = b.observed<events::ChatReceived>();
        assert(got[0].second.entry.text == "one");
        assert(got[1].second.entry.text == "two");
        printf("  [OK] Lost first message released before its successor\n");
    }

    // --- Ids restart with each session ---
    {
        Solo s;
        std::uint32_t id = 0;
        assert(!s.chat.send("first ride", s.t0, &id));
        assert(id == 1);
        s.chat.close();
        s.chat.open("session-2");
        s.chat.set_roster({"rider-a", "rider-b"});
        assert(!s.chat.send("second ride", s.t0, &id));
        assert(id == 1);
        printf("  [OK] Message ids restart per session\n");
    }

    // --- Roster shrink settles the wait ---
    {
        Solo s;
        std::uint32_t id = 0;
        assert(!s.chat.send("regroup at the top", s.t0, &id));
        s.chat.handle(s.ack("rider-b", id), s.t0 + Millis(10));
        assert(s.chat.find("rider-a", id)->status == ChatStatus::Pending);

        s.chat.set_roster({"rider-a", "rider-b"});
        auto entry = s.chat.find("rider-a", id);
        assert(entry->status == ChatStatus::Delivered);
        assert(entry->acked_by.size() == 1);
        assert(entry->recipients == 2);

        // nobody acknowledged before everyone left
        std::uint32_t orphan = 0;
        assert(!s.chat.send("wait up", s.t0 + Millis(20), &orphan));
        s.chat.set_roster({"rider-a"});
        assert(s.chat.find("rider-a", orphan)->status == ChatStatus::Failed);
        assert(s.statuses().back().message_id == orphan);
        assert(s.statuses().back().status == ChatStatus::Failed);
        assert(s.statuses().back().acked == 0);
        printf("  [OK] Departed recipients stop being waited for\n");
    }

    // --- Alone in the session ---
    {
        Solo s;
        s.chat.set_roster({"rider-a"});
        assert(!s.chat.send("anyone?", s.t0));
        assert(s.out.sent.empty());
        assert(s.statuses().back().status == ChatStatus::Delivered);
        assert(s.statuses().back().recipients == 0);
        printf("  [OK] Message with no recipients is delivered\n");
    }

    // --- Errors and truncation ---
    {
        Config cfg;
        sim::RecordingOutbox out;
        Rider me(RiderId("rider-a"), "alice");
        ChatService chat(me, cfg, out);
        assert(chat.send("hi", sim::epoch()) == make_error_code(errc::not_in_session));

        chat.open("session-1");
        assert(chat.send("   \t ", sim::epoch()) == make_error_code(errc::empty_message));
        assert(chat.log().empty());

        std::string e_acute;
        for (int i = 0; i < 300; ++i) e_acute += "\xC3\xA9";
        assert(ChatService::truncate_utf8(e_acute).size() == 500);

        std::string euro;
        for (int i = 0; i < 200; ++i) euro += "\xE2\x82\xAC";
        assert(ChatService::truncate_utf8(euro).size() == 498);
        assert(ChatService::truncate_utf8("short") == "short");

        chat.set_roster({"rider-a", "rider-b"});
        assert(!chat.send(euro, sim::epoch()));
        assert(chat.log().back().text.size() == 498);
        assert(out.bodies<protocol::ChatMessage>().back().text.size() == 498);
        printf("  [OK] Errors and UTF-8 truncation\n");
    }

    // --- Close fails what is still pending ---
    {
        Solo s;
        assert(!s.chat.send("last words", s.t0));
        auto history = s.chat.close();
        assert(history.size() == 1);
        assert(history[0].status == ChatStatus::Failed);
        assert(!s.chat.is_open());
        assert(s.chat.log().empty());
        printf("  [OK] Close returns the log\n");
    }

    printf("=== all chat tests passed ===\n");
    return 0;
}
