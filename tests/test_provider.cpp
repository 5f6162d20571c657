#include <catch2/catch_test_macros.hpp>

#include "settings.hpp"
#include "stt/provider.hpp"

TEST_CASE("resolve_provider", "[stt][provider]") {
    Settings s;
    s.stt_api.enabled = true;

    SECTION("DisabledFails") {
        s.stt_api.enabled = false;
        auto r = resolve_provider(s);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == SttErrorKind::NotEnabled);
        REQUIRE(r.error().message == "STT API is not enabled");
    }

    SECTION("UnknownProviderFails") {
        s.stt_api.provider_id = "missing";
        auto r = resolve_provider(s);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == SttErrorKind::NoProviderConfigured);
    }

    SECTION("DefaultsForAbsentKeyAndModel") {
        auto r = resolve_provider(s);
        REQUIRE(r.has_value());
        REQUIRE(r->provider.id == "openai");
        REQUIRE(r->api_key.empty());
        REQUIRE(r->model == "whisper-1");
        REQUIRE_FALSE(r->language.has_value());
    }

    SECTION("UsesActiveProviderEntries") {
        s.stt_api.provider_id = "groq";
        s.stt_api.api_keys = {{"openai", "sk-openai"}, {"groq", "gsk-groq"}};
        s.stt_api.models = {{"groq", "whisper-large-v3-turbo"}};

        auto r = resolve_provider(s);
        REQUIRE(r.has_value());
        REQUIRE(r->provider.base_url == "https://api.groq.com/openai/v1");
        REQUIRE(r->api_key == "gsk-groq");
        REQUIRE(r->model == "whisper-large-v3-turbo");
    }

    SECTION("LanguagePassedThrough") {
        s.selected_language = "pt-BR";
        auto r = resolve_provider(s);
        REQUIRE(r->language == "pt-BR");
    }

    SECTION("AutoAndEmptyLanguageOmitted") {
        s.selected_language = "auto";
        REQUIRE_FALSE(resolve_provider(s)->language.has_value());

        s.selected_language = "";
        REQUIRE_FALSE(resolve_provider(s)->language.has_value());
    }
}
