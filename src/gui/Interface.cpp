#include "Interface.hpp"
#include "imgui.h"
#include "imgui-SFML.h"
#include <SFML/Graphics.hpp>
#include <vector>
#include <string>
#include <iostream>
#include <optional>

#include "BoardState.hpp"
#include "Game.hpp"

const int TILE_SIZE = 80;
const int BOARD_PADDING = 30;
const int PANEL_WIDTH = 300;
const int BOARD_PIXEL_SIZE = 8 * TILE_SIZE;
const int OFFSET_X = BOARD_PADDING;
const int OFFSET_Y = BOARD_PADDING;
const int WIN_WIDTH = BOARD_PIXEL_SIZE + (2 * BOARD_PADDING) + PANEL_WIDTH;
const int WIN_HEIGHT = BOARD_PIXEL_SIZE + (2 * BOARD_PADDING);

const sf::Color LIGHT(240, 217, 181);
const sf::Color DARK(181, 136, 99);
const sf::Color SELECTED(186, 202, 68);
const sf::Color SELECTED_BORDER(80, 120, 20);
const sf::Color MOVE_DOT(30, 30, 30);
const sf::Color CAPTURE_RING(200, 30, 30);

struct Assets {
    sf::Font font;
    bool has_font = false;
    void load() {
        if (font.loadFromFile("assets/font.TTF")) {
            has_font = true;
        } else {
            std::cerr << "Could not load assets/font.TTF, drawing pieces as discs" << std::endl;
        }
    }
};

Square get_square_at(int mouse_x, int mouse_y, bool flipped) {
    int x = mouse_x - OFFSET_X;
    int y = mouse_y - OFFSET_Y;
    if (x < 0 || x >= BOARD_PIXEL_SIZE || y < 0 || y >= BOARD_PIXEL_SIZE) return Square(-1, -1);
    int col = x / TILE_SIZE; int row = y / TILE_SIZE;
    int file = flipped ? (7 - col) : col;
    int rank = flipped ? (7 - row) : row;
    return Square(rank, file);
}

sf::Vector2f square_origin(Square sq, bool flipped) {
    int col = flipped ? (7 - sq.file) : sq.file;
    int row = flipped ? (7 - sq.rank) : sq.rank;
    return sf::Vector2f(static_cast<float>(OFFSET_X + col * TILE_SIZE), static_cast<float>(OFFSET_Y + row * TILE_SIZE));
}

// U+2654..U+2659 are the white King..Pawn glyphs, black ones follow at +6
sf::Uint32 piece_glyph(const Piece& p) {
    sf::Uint32 code = 0x2659 - static_cast<sf::Uint32>(p.type);
    return (p.colour == Colour::Black) ? code + 6 : code;
}

const char* colour_name(Colour c) {
    if (c == Colour::White) return "White";
    if (c == Colour::Black) return "Black";
    return "Nobody";
}

namespace GUI {
    void Launch(const GameConfig& config) {
        sf::RenderWindow window(sf::VideoMode(WIN_WIDTH, WIN_HEIGHT), "Mini Chess");
        window.setFramerateLimit(60);
        if (!ImGui::SFML::Init(window)) {
            std::cerr << "ImGui-SFML initialisation failed" << std::endl;
            return;
        }

        Game game(config);

        Assets assets; assets.load();
        std::optional<Square> selected_sq;
        std::vector<Move> valid_moves;
        sf::Clock deltaClock;

        bool view_flipped = (config.agent_side == Colour::White);
        int promo_choice = 0;
        const PieceType promo_types[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight};
        const char* promo_names[] = {"Queen", "Rook", "Bishop", "Knight"};

        int agent_choice = (config.agent_side == Colour::White) ? 0 : (config.agent_side == Colour::Black ? 1 : 2);
        std::string last_move_text;

        auto clear_selection = [&]() {
            selected_sq.reset();
            valid_moves.clear();
        };

        auto handle_click = [&](Square clicked) {
            if (!clicked.on_board()) { clear_selection(); return; }

            std::optional<Piece> piece = game.piece_at(clicked);

            // Selecting (or reselecting) one of our own pieces
            if (piece && piece->colour == game.side_to_move()) {
                selected_sq = clicked;
                valid_moves = game.moves_from(clicked);
                return;
            }

            if (selected_sq) {
                for (const auto& m : valid_moves) {
                    if (m.to() == clicked) {
                        Move played(m.from(), m.to(), promo_types[promo_choice]);
                        Colour mover = game.side_to_move();
                        if (game.apply_move(played)) {
                            last_move_text = std::string(colour_name(mover)) + ": " + move_name(played);
                        }
                        break;
                    }
                }
            }
            clear_selection();
        };

        auto render_board = [&]() {
            sf::RectangleShape tile(sf::Vector2f(TILE_SIZE, TILE_SIZE));
            for (int r = 0; r < 8; ++r) {
                for (int f = 0; f < 8; ++f) {
                    tile.setFillColor(((r + f) % 2 == 0) ? LIGHT : DARK);
                    tile.setPosition(square_origin(Square(r, f), view_flipped));
                    window.draw(tile);
                }
            }

            if (selected_sq) {
                tile.setPosition(square_origin(*selected_sq, view_flipped));
                tile.setFillColor(SELECTED);
                tile.setOutlineColor(SELECTED_BORDER);
                tile.setOutlineThickness(-3.f);
                window.draw(tile);
                tile.setOutlineThickness(0.f);

                for (const auto& m : valid_moves) {
                    sf::Vector2f o = square_origin(m.to(), view_flipped);
                    sf::Vector2f centre(o.x + TILE_SIZE / 2.0f, o.y + TILE_SIZE / 2.0f);
                    if (!game.piece_at(m.to())) {
                        sf::CircleShape dot(7.f);
                        dot.setOrigin(7.f, 7.f);
                        dot.setPosition(centre);
                        dot.setFillColor(MOVE_DOT);
                        window.draw(dot);
                    } else {
                        sf::CircleShape ring(15.f);
                        ring.setOrigin(15.f, 15.f);
                        ring.setPosition(centre);
                        ring.setFillColor(sf::Color::Transparent);
                        ring.setOutlineColor(CAPTURE_RING);
                        ring.setOutlineThickness(4.f);
                        window.draw(ring);
                    }
                }
            }

            for (int r = 0; r < 8; ++r) {
                for (int f = 0; f < 8; ++f) {
                    std::optional<Piece> p = game.piece_at(Square(r, f));
                    if (!p) continue;
                    sf::Vector2f o = square_origin(Square(r, f), view_flipped);
                    float cx = o.x + TILE_SIZE / 2.0f;
                    float cy = o.y + TILE_SIZE / 2.0f;
                    sf::Color fill = (p->colour == Colour::White) ? sf::Color(250, 250, 250) : sf::Color(10, 10, 10);

                    if (assets.has_font) {
                        sf::Text text(sf::String(piece_glyph(*p)), assets.font, TILE_SIZE - 10);
                        sf::FloatRect bounds = text.getLocalBounds();
                        text.setOrigin(bounds.left + bounds.width / 2.0f, bounds.top + bounds.height / 2.0f);

                        // Drop shadow for contrast
                        text.setFillColor(sf::Color::Black);
                        text.setPosition(cx + 2.f, cy + 2.f);
                        window.draw(text);

                        text.setFillColor(fill);
                        text.setPosition(cx, cy);
                        window.draw(text);
                    } else {
                        sf::CircleShape disc(TILE_SIZE * 0.35f);
                        disc.setOrigin(TILE_SIZE * 0.35f, TILE_SIZE * 0.35f);
                        disc.setPosition(cx, cy);
                        disc.setFillColor(fill);
                        disc.setOutlineColor(sf::Color(90, 90, 90));
                        disc.setOutlineThickness(2.f);
                        window.draw(disc);
                    }
                }
            }
        };

        std::cout << "--- ENGINE STARTED --- agent plays " << colour_name(game.agent_side()) << std::endl;

        while (window.isOpen()) {
            sf::Event event;
            while (window.pollEvent(event)) {
                ImGui::SFML::ProcessEvent(window, event);
                if (event.type == sf::Event::Closed) {
                    window.close();
                }

                // Human input is ignored while the agent owns the turn
                if (!game.is_agent_turn() && event.type == sf::Event::MouseButtonPressed
                    && event.mouseButton.button == sf::Mouse::Left) {
                    if (ImGui::GetIO().WantCaptureMouse) continue;
                    handle_click(get_square_at(event.mouseButton.x, event.mouseButton.y, view_flipped));
                }
            }

            ImGui::SFML::Update(window, deltaClock.restart());

            bool side_has_moves = !game.moves(game.side_to_move()).empty();

            // --- SIDEBAR UI ---
            ImGui::SetNextWindowPos(ImVec2(static_cast<float>(WIN_WIDTH - PANEL_WIDTH), 0.f));
            ImGui::SetNextWindowSize(ImVec2(static_cast<float>(PANEL_WIDTH), static_cast<float>(WIN_HEIGHT)));
            ImGui::Begin("Controls", nullptr, ImGuiWindowFlags_NoDecoration);

            ImGui::TextColored(ImVec4(1,1,0,1), "GAME STATUS");
            ImGui::Separator();
            ImGui::Text("Turn: %s", colour_name(game.side_to_move()));
            ImGui::Text("Ply: %d", game.ply());
            ImGui::Text("Material (White): %+d", game.material_score(Colour::White));
            if (!last_move_text.empty()) ImGui::Text("Last move: %s", last_move_text.c_str());

            if (!side_has_moves) {
                ImGui::TextColored(ImVec4(1, 0, 0, 1), "%s has no move", colour_name(game.side_to_move()));
                if (!game.is_agent_turn() && ImGui::Button("Pass Turn", ImVec2(100, 30))) {
                    game.pass_turn();
                    clear_selection();
                }
            }

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,1,1), "SETTINGS");
            ImGui::Separator();
            ImGui::Checkbox("Flip Board", &view_flipped);
            ImGui::Combo("Promote to", &promo_choice, promo_names, 4);

            ImGui::Text("Agent plays:");
            bool agent_changed = false;
            agent_changed |= ImGui::RadioButton("White", &agent_choice, 0); ImGui::SameLine();
            agent_changed |= ImGui::RadioButton("Black", &agent_choice, 1); ImGui::SameLine();
            agent_changed |= ImGui::RadioButton("None", &agent_choice, 2);
            if (agent_changed) {
                Colour sides[] = {Colour::White, Colour::Black, Colour::None};
                game.set_agent_side(sides[agent_choice]);
                clear_selection();
            }

            ImGui::Spacing();
            ImGui::TextColored(ImVec4(0,1,0,1), "AGENT STATS");
            ImGui::Separator();
            const Search::SearchStats& stats = game.last_stats();
            if (stats.candidates > 0) {
                ImGui::Text("Candidates: %d", stats.candidates);
                ImGui::Text("Best score: %.1f", stats.best_score);
                ImGui::Text("Tied best: %d", stats.tied_best);
                ImGui::Text("Best capture: %d", stats.best_capture_value);
            }

            ImGui::Spacing(); ImGui::Separator();
            if (ImGui::Button("Reset Game", ImVec2(100, 30))) {
                game.reset();
                clear_selection();
                last_move_text.clear();
            }

            ImGui::End();

            // Agent moves synchronously on its turn
            if (game.is_agent_turn()) {
                Colour mover = game.side_to_move();
                std::optional<Move> best = game.play_agent_turn();
                if (best) {
                    last_move_text = std::string(colour_name(mover)) + ": " + move_name(*best);
                    std::cout << "Agent move: " << move_name(*best) << std::endl;
                } else {
                    std::cout << colour_name(mover) << " has no move, passing" << std::endl;
                }
            }

            window.clear(sf::Color(30, 30, 30));
            render_board();
            ImGui::SFML::Render(window);
            window.display();
        }

        ImGui::SFML::Shutdown();
    }
}
