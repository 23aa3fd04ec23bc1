#include <cassert>
#include <iostream>
#include <memory>

#include "application/ItineraryService.hpp"
#include "test/TestSupport.hpp"

using namespace trekplanner;
using application::ItineraryService;
using domain::ItineraryErrorKind;
using domain::PoiCategory;
using domain::Theme;
using domain::TimeOfDay;
using test::MakePoi;

namespace {

domain::ItineraryRequest MakeRequest(const std::string& city, const std::string& country, Theme theme,
                                     int planSize, const std::string& start = "09:00",
                                     const std::string& end = "22:00") {
    domain::ItineraryRequest request;
    request.city = city;
    request.country = country;
    request.theme = theme;
    request.planSize = planSize;
    request.startTime = TimeOfDay::Parse(start).value();
    request.endTime = TimeOfDay::Parse(end).value();
    return request;
}

ItineraryService MakeService(std::vector<domain::Poi> pois, application::SchedulerOptions options = {}) {
    return ItineraryService(std::make_shared<test::InMemoryCatalog>(std::move(pois)),
                            domain::ThemeDescriptorTable::Defaults(), {}, options);
}

void testCairoCultural() {
    std::cout << "[Test] Cairo cultural, three slots..." << std::endl;
    auto service = MakeService(test::CairoCatalog());
    auto result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 3));
    assert(result.succeeded() && !result.error);

    const auto& it = *result.itinerary;
    assert(it.name == "1-Day Cairo Explorer");
    assert(it.shortDescription ==
           "A cultural day in Cairo, Egypt: 3 carefully selected places from 09:00 to 22:00.");
    assert(it.slots.size() == 3);

    assert(it.slots[0].poi.id == 100);
    assert(it.slots[0].poi.category == PoiCategory::Hotel);
    assert(it.slots[0].start.toString() == "09:00");
    assert(it.slots[0].end.toString() == "13:20");
    assert(it.slots[0].poi.matchedThemes.empty());

    assert(it.slots[1].poi.id == 1);
    assert(it.slots[1].poi.name == "Egyptian Museum");
    assert(it.slots[1].relevanceScore == 0.2);
    assert(it.slots[1].start.toString() == "13:20");
    assert(it.slots[1].end.toString() == "17:40");
    assert(it.slots[1].poi.matchedThemes == std::vector<Theme>{Theme::Cultural});

    assert(it.slots[2].poi.id == 3);
    assert(it.slots[2].relevanceScore == 0.1);
    assert(it.slots[2].end.toString() == "22:00");
    assert((it.slots[2].poi.matchedThemes == std::vector<Theme>{Theme::Cultural, Theme::Foodies}));
    std::cout << "[PASS] Cairo cultural." << std::endl;
}

void testFullDayVariety() {
    std::cout << "[Test] Six slots alternate categories..." << std::endl;
    auto service = MakeService(test::CairoCatalog());
    auto result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 6));
    assert(result.succeeded());
    const auto& slots = result.itinerary->slots;
    assert(slots.size() == 6);

    const long long expected[] = {100, 1, 3, 2, 4, 5};
    for (size_t i = 0; i < slots.size(); ++i) {
        assert(slots[i].poi.id == expected[i]);
        if (i > 0) assert(slots[i].start == slots[i - 1].end);
    }
    for (size_t i = 2; i < slots.size(); ++i) {
        assert(slots[i].poi.category != slots[i - 1].poi.category);
    }
    assert(slots[0].durationMinutes() == 130);
    assert(slots[5].start.toString() == "19:50");
    std::cout << "[PASS] Six slots." << std::endl;
}

void testZeroScoreFallsBackToCatalogOrder() {
    std::cout << "[Test] Adventure with no matches..." << std::endl;
    auto service = MakeService(test::CairoCatalog());
    auto result = service.generate(MakeRequest("cairo", "EGYPT", Theme::Adventure, 3));
    assert(result.succeeded());
    const auto& slots = result.itinerary->slots;
    assert(slots.size() == 3);
    assert(slots[1].poi.id == 1 && slots[1].relevanceScore == 0.0);
    assert(slots[2].poi.id == 3 && slots[2].relevanceScore == 0.0);
    std::cout << "[PASS] Adventure fallback." << std::endl;
}

void testHotelOnlyPlan() {
    std::cout << "[Test] Plan size one..." << std::endl;
    auto service = MakeService(test::CairoCatalog());
    auto result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Family, 1));
    assert(result.succeeded());
    const auto& slots = result.itinerary->slots;
    assert(slots.size() == 1);
    assert(slots[0].poi.id == 100);
    assert(slots[0].start.toString() == "09:00" && slots[0].end.toString() == "22:00");
    std::cout << "[PASS] Plan size one." << std::endl;
}

void testErrors() {
    std::cout << "[Test] Classified errors..." << std::endl;
    auto service = MakeService(test::CairoCatalog());

    auto result = service.generate(MakeRequest("Atlantis", "Nowhere", Theme::Cultural, 3));
    assert(!result.succeeded() && result.error->kind == ItineraryErrorKind::NoPoisFound);

    auto noHotel = test::CairoCatalog();
    noHotel.erase(noHotel.begin());
    result = MakeService(noHotel).generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 3));
    assert(result.error && result.error->kind == ItineraryErrorKind::NoHotelAvailable);

    std::vector<domain::Poi> hotelOnly = {MakePoi(100, PoiCategory::Hotel, "Nile View Hotel", "rooms")};
    result = MakeService(hotelOnly).generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 3));
    assert(result.error && result.error->kind == ItineraryErrorKind::InsufficientCandidates);

    result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 3, "22:00", "09:00"));
    assert(result.error && result.error->kind == ItineraryErrorKind::InvalidWindow);
    assert(!result.itinerary);

    result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 3, "12:00", "12:00"));
    assert(result.error && result.error->kind == ItineraryErrorKind::InvalidWindow);

    result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 6, "09:00", "09:03"));
    assert(result.error && result.error->kind == ItineraryErrorKind::InvalidWindow);
    std::cout << "[PASS] Classified errors." << std::endl;
}

void testIdempotence() {
    std::cout << "[Test] Same request, same itinerary..." << std::endl;
    auto service = MakeService(test::CairoCatalog());
    const auto request = MakeRequest("Cairo", "Egypt", Theme::Foodies, 4, "10:00", "20:30");
    auto first = service.generate(request);
    auto second = service.generate(request);
    assert(first.succeeded() && second.succeeded());
    assert(*first.itinerary == *second.itinerary);
    std::cout << "[PASS] Idempotence." << std::endl;
}

void testMultipleHotels() {
    std::cout << "[Test] Exactly one hotel is scheduled..." << std::endl;
    auto pois = test::CairoCatalog();
    pois.push_back(MakePoi(101, PoiCategory::Hotel, "Heritage Palace Hotel", "historic heritage palace"));
    auto result = MakeService(pois).generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 6));
    assert(result.succeeded());
    int hotels = 0;
    for (const auto& slot : result.itinerary->slots) {
        if (slot.poi.category == PoiCategory::Hotel) hotels++;
    }
    assert(hotels == 1);
    assert(result.itinerary->slots[0].poi.id == 101);
    std::cout << "[PASS] One hotel." << std::endl;
}

void testShrinkAndClamp() {
    std::cout << "[Test] Plan shrinks to the catalog and clamps oversized requests..." << std::endl;
    auto service = MakeService(test::CairoCatalog());
    auto result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 10));
    assert(result.succeeded() && result.itinerary->slots.size() == 6);
    assert(result.itinerary->slots.back().end.toString() == "22:00");

    result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 50));
    assert(result.succeeded());
    assert(result.itinerary->request.planSize == domain::ItineraryRequest::kMaxPlanSize);
    assert(result.itinerary->slots.size() == 6);
    std::cout << "[PASS] Shrink and clamp." << std::endl;
}

void testAlignedSlots() {
    std::cout << "[Test] Half-hour aligned slots..." << std::endl;
    auto service = MakeService(test::CairoCatalog(), application::SchedulerOptions{30});
    auto result = service.generate(MakeRequest("Cairo", "Egypt", Theme::Cultural, 6));
    assert(result.succeeded());
    const auto& slots = result.itinerary->slots;
    for (size_t i = 0; i + 1 < slots.size(); ++i) {
        assert(slots[i].durationMinutes() == 120);
    }
    assert(slots.back().durationMinutes() == 180);
    assert(slots.back().end.toString() == "22:00");
    std::cout << "[PASS] Aligned slots." << std::endl;
}

void testNames() {
    assert(ItineraryService::BuildName("PARIS") == "1-Day Parisian Adventure");
    assert(ItineraryService::BuildName("new york") == "1-Day NYC Experience");
    assert(ItineraryService::BuildName("luxor") == "1-Day Luxor Discovery");
    assert(ItineraryService::BuildName("sharm el-sheikh") == "1-Day Sharm El-Sheikh Discovery");
}

} // namespace

int main() {
    std::cout << "[Test] Starting ItineraryService Test..." << std::endl;
    testCairoCultural();
    testFullDayVariety();
    testZeroScoreFallsBackToCatalogOrder();
    testHotelOnlyPlan();
    testErrors();
    testIdempotence();
    testMultipleHotels();
    testShrinkAndClamp();
    testAlignedSlots();
    testNames();
    std::cout << "[PASS] ItineraryService Test." << std::endl;
    return 0;
}
